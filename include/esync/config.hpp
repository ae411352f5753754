#pragma once
#include <optional>
#include <string>
#include <vector>

namespace esync {

enum class AlignMethod { Local, Harp, None };

struct HarpConfig {
    // Substring identifying the stream that carries the Harp barcode line (NI-DAQ).
    std::string stream_pattern = "PXIe";
    // Gap (s) separating two barcodes.
    double segment_gap_s = 0.5;
    double baud_rate = 1000.0;
    // Line search: a rising edge preceded by a gap longer than this starts a barcode.
    double onset_gap_s = 0.1;
    // Line search: inter-edge gaps shorter than this count as intra-barcode.
    double short_gap_s = 0.05;
    double bin_width_s = 100.0;
    double min_p_value = 0.95;
    double min_short_gap_fraction = 0.5;
    // Line to use when more than one line passes the line search.
    std::optional<int> line;
    std::string archive_filename = "local_timestamps.npy";
};

struct AlignConfig {
    AlignMethod method = AlignMethod::Local;
    // Index (within the recording) of the stream every other stream is aligned to.
    size_t reference_stream = 0;
    // TTL line carrying the shared sync pulses.
    int sync_line = 1;
    // Streams whose name contains one of these reports the sync line inverted.
    std::vector<std::string> inverted_streams;
    // More discontinuities than this makes a counter non-realignable.
    size_t max_discontinuities = 2;
    // Drop sync events inside residual chunks left behind by a counter restart.
    bool drop_residual_chunks = false;
    // First-edge offset (s) above which a count mismatch is blamed on the first edge.
    double trim_offset_threshold_s = 0.1;
    std::string timestamp_filename = "timestamps.npy";
    std::string archive_filename = "original_timestamps.npy";
    HarpConfig harp;
    // Prompt on ambiguous Harp lines instead of failing the recording.
    bool interactive = false;
};

// Throws std::invalid_argument on out-of-range values.
void validate_config(const AlignConfig& cfg);

bool is_inverted_stream(const AlignConfig& cfg, const std::string& stream_name);

std::optional<AlignMethod> parse_align_method(const std::string& s);
const char* to_string(AlignMethod m);

} // namespace esync
