#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "esync/types.hpp"

namespace esync::io {

// Continuous stream entry of structure.oebin.
struct OebinStream {
    std::string folder_name;  // trailing '/' removed
    std::string stream_name;
    double sample_rate{0.0};
    int source_processor_id{0};
};

// Extract the "continuous" entries of a structure.oebin document.
// Throws std::runtime_error when the document has no continuous array.
std::vector<OebinStream> parse_oebin_continuous(const std::string& json_text);

// All recording directories (.../Record Node N/experimentE/recordingR) under
// 'root', in path order. 'root' may be a session directory or a record node.
// Throws MissingFileError if 'root' does not exist.
std::vector<std::filesystem::path> find_recordings(const std::filesystem::path& root);

// Record node / experiment / recording indices parsed from a recording path.
RecordingId recording_id(const std::filesystem::path& recording_dir);

// Load one recording directory. A stream whose continuous or TTL files are
// missing or unreadable is kept with load_error set; a stream without a TTL
// folder has no events.
Recording load_recording(const std::filesystem::path& recording_dir,
                         const std::string& timestamp_filename = "timestamps.npy");

// Every recording under 'root' (see find_recordings), loaded in path order.
std::vector<Recording> load_session(const std::filesystem::path& root,
                                    const std::string& timestamp_filename = "timestamps.npy");

std::filesystem::path continuous_dir(const Recording& rec, size_t stream);
std::filesystem::path events_dir(const Recording& rec, size_t stream);

} // namespace esync::io
