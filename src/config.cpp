#include "esync/config.hpp"
#include "esync/types.hpp"
#include <cmath>
#include <stdexcept>

namespace esync {

static void require_positive(double v, const char* name) {
    if (!(v > 0.0) || !std::isfinite(v))
        throw std::invalid_argument(std::string(name) + " must be positive");
}

void validate_config(const AlignConfig& cfg) {
    require_positive(cfg.trim_offset_threshold_s, "trim_offset_threshold_s");
    require_positive(cfg.harp.segment_gap_s, "harp.segment_gap_s");
    require_positive(cfg.harp.baud_rate, "harp.baud_rate");
    require_positive(cfg.harp.onset_gap_s, "harp.onset_gap_s");
    require_positive(cfg.harp.short_gap_s, "harp.short_gap_s");
    require_positive(cfg.harp.bin_width_s, "harp.bin_width_s");
    if (cfg.harp.min_p_value < 0.0 || cfg.harp.min_p_value > 1.0)
        throw std::invalid_argument("harp.min_p_value must be in [0, 1]");
    if (cfg.harp.min_short_gap_fraction < 0.0 || cfg.harp.min_short_gap_fraction > 1.0)
        throw std::invalid_argument("harp.min_short_gap_fraction must be in [0, 1]");
    if (cfg.timestamp_filename.empty() || cfg.archive_filename.empty() || cfg.harp.archive_filename.empty())
        throw std::invalid_argument("timestamp and archive filenames must not be empty");
    if (cfg.timestamp_filename == cfg.archive_filename || cfg.timestamp_filename == cfg.harp.archive_filename)
        throw std::invalid_argument("archive filename must differ from the timestamp filename");
}

bool is_inverted_stream(const AlignConfig& cfg, const std::string& stream_name) {
    for (const auto& pat : cfg.inverted_streams)
        if (!pat.empty() && stream_name.find(pat) != std::string::npos) return true;
    return false;
}

std::optional<AlignMethod> parse_align_method(const std::string& s) {
    if (s == "local") return AlignMethod::Local;
    if (s == "harp") return AlignMethod::Harp;
    if (s == "none") return AlignMethod::None;
    return std::nullopt;
}

const char* to_string(AlignMethod m) {
    switch (m) {
        case AlignMethod::Local: return "local";
        case AlignMethod::Harp: return "harp";
        case AlignMethod::None: return "none";
    }
    return "?";
}

std::string to_string(const RecordingId& id) {
    return "Record Node " + id.record_node + " - Experiment " + std::to_string(id.experiment_index) +
           " - Recording " + std::to_string(id.recording_index);
}

} // namespace esync
