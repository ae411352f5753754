#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace esync {

// One continuous acquisition stream. sample_numbers is the device's raw
// sample counter (nominally +1 per sample); timestamps the per-sample time
// written by the acquisition software.
struct ContinuousStream {
    std::string name;          // e.g. "ProbeA-AP", "PXIe-6341"
    std::string folder_name;   // directory under continuous/ and events/
    int source_processor_id{0};
    double sample_rate{0.0};   // Hz
    std::vector<int64_t> sample_numbers;
    std::vector<double> timestamps;
    // Non-empty when the stream's data could not be read.
    std::string load_error;

    size_t sample_count() const { return sample_numbers.size(); }
};

// A single TTL edge. sample_number lives in the counter space of the owning stream.
struct Event {
    size_t stream{0};
    int line{0};
    int state{0};              // 1 rising, 0 falling
    int64_t sample_number{0};
    double timestamp{0.0};
};

using EventStream = std::vector<Event>;

struct RecordingId {
    std::string record_node;
    int experiment_index{1};
    int recording_index{1};
};

struct Recording {
    RecordingId id;
    std::filesystem::path directory;  // empty for in-memory recordings
    std::vector<ContinuousStream> continuous;
    EventStream events;
};

// Calibration points of a piecewise-linear time map.
// sample_index must be strictly increasing and hold at least two entries.
struct AnchorSet {
    std::vector<double> sample_index;
    std::vector<double> target_time;

    size_t size() const { return sample_index.size(); }
    bool empty() const { return sample_index.empty(); }
};

std::string to_string(const RecordingId& id);

} // namespace esync
