#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include "esync/types.hpp"

namespace esync::align {

// Sync edges of one stream, sorted by sample number.
struct SyncEdges {
    double sample_rate{0.0};
    std::vector<int64_t> sample_numbers;
    std::vector<double> event_times;  // timestamp recorded alongside each edge

    size_t size() const { return sample_numbers.size(); }
    bool empty() const { return sample_numbers.empty(); }
    // Time of the first edge on the stream's own clock (sample / rate).
    double first_time() const;
    void drop_front();
    void drop_back();
};

// Events owned by 'stream', file order kept.
EventStream events_for_stream(const EventStream& events, size_t stream);

// Edges of 'line' on 'stream' with state 1 (state 0 when the stream sees the
// line inverted), stably sorted by sample number.
EventStream select_sync_events(const EventStream& events, size_t stream, int line, bool inverted);

SyncEdges to_sync_edges(const EventStream& sorted_events, double sample_rate);

// Anchors (sample_number, (sample_number - origin) / sample_rate). The origin
// defaults to the first edge, so the first anchor sits at time zero.
// Throws DataIntegrityError for fewer than two edges or a non-positive rate.
AnchorSet build_anchor_set(const SyncEdges& edges, std::optional<int64_t> origin = std::nullopt);

// Convenience: select + sort + convert for one stream of a recording.
SyncEdges sync_edges_for_stream(const Recording& rec, size_t stream, int line, bool inverted);

} // namespace esync::align
