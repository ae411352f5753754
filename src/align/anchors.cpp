#include "esync/align/anchors.hpp"
#include "esync/errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace esync::align {

double SyncEdges::first_time() const {
    if (sample_numbers.empty()) throw DataIntegrityError("no sync edges");
    return static_cast<double>(sample_numbers.front()) / sample_rate;
}

void SyncEdges::drop_front() {
    if (sample_numbers.empty()) return;
    sample_numbers.erase(sample_numbers.begin());
    if (!event_times.empty()) event_times.erase(event_times.begin());
}

void SyncEdges::drop_back() {
    if (sample_numbers.empty()) return;
    sample_numbers.pop_back();
    if (!event_times.empty()) event_times.pop_back();
}

EventStream events_for_stream(const EventStream& events, size_t stream) {
    EventStream out;
    for (const auto& e : events)
        if (e.stream == stream) out.push_back(e);
    return out;
}

EventStream select_sync_events(const EventStream& events, size_t stream, int line, bool inverted) {
    const int want = inverted ? 0 : 1;
    EventStream out;
    for (const auto& e : events)
        if (e.stream == stream && e.line == line && e.state == want) out.push_back(e);
    // persisted events are not guaranteed to be in sample order
    std::stable_sort(out.begin(), out.end(),
                     [](const Event& a, const Event& b) { return a.sample_number < b.sample_number; });
    return out;
}

SyncEdges to_sync_edges(const EventStream& sorted_events, double sample_rate) {
    SyncEdges edges;
    edges.sample_rate = sample_rate;
    edges.sample_numbers.reserve(sorted_events.size());
    edges.event_times.reserve(sorted_events.size());
    for (const auto& e : sorted_events) {
        edges.sample_numbers.push_back(e.sample_number);
        edges.event_times.push_back(e.timestamp);
    }
    return edges;
}

AnchorSet build_anchor_set(const SyncEdges& edges, std::optional<int64_t> origin) {
    if (!(edges.sample_rate > 0.0))
        throw DataIntegrityError("invalid sample rate " + std::to_string(edges.sample_rate));
    if (edges.size() < 2)
        throw DataIntegrityError("need at least 2 sync edges to anchor a stream, found " +
                                 std::to_string(edges.size()));
    const int64_t o = origin.value_or(edges.sample_numbers.front());
    AnchorSet a;
    a.sample_index.reserve(edges.size());
    a.target_time.reserve(edges.size());
    for (int64_t s : edges.sample_numbers) {
        a.sample_index.push_back(static_cast<double>(s));
        a.target_time.push_back(static_cast<double>(s - o) / edges.sample_rate);
    }
    return a;
}

SyncEdges sync_edges_for_stream(const Recording& rec, size_t stream, int line, bool inverted) {
    if (stream >= rec.continuous.size())
        throw std::out_of_range("stream index " + std::to_string(stream) + " out of range");
    return to_sync_edges(select_sync_events(rec.events, stream, line, inverted),
                         rec.continuous[stream].sample_rate);
}

} // namespace esync::align
