#include "esync/align/discontinuity.hpp"
#include "esync/log.hpp"
#include <algorithm>
#include <map>

namespace esync::align {

bool DiscontinuityReport::residuals_removable() const {
    return std::all_of(removable.begin(), removable.end(), [](bool r) { return r; });
}

static bool strictly_inside(int64_t v, const SampleRange& r) {
    return v > r.first && v < r.last;
}

// Number of values in [lo, hi) covered by the union of 'ranges'.
static int64_t covered_count(std::vector<SampleRange> ranges, int64_t lo, int64_t hi) {
    std::vector<SampleRange> clipped;
    for (const auto& r : ranges) {
        int64_t a = std::max(r.first, lo);
        int64_t b = std::min(r.last, hi - 1);
        if (a <= b) clipped.push_back({a, b});
    }
    std::sort(clipped.begin(), clipped.end(),
              [](const SampleRange& x, const SampleRange& y) { return x.first < y.first; });
    int64_t total = 0;
    int64_t cur_first = 0, cur_last = -1;
    bool open = false;
    for (const auto& r : clipped) {
        if (open && r.first <= cur_last + 1) {
            cur_last = std::max(cur_last, r.last);
            continue;
        }
        if (open) total += cur_last - cur_first + 1;
        cur_first = r.first;
        cur_last = r.last;
        open = true;
    }
    if (open) total += cur_last - cur_first + 1;
    return total;
}

DiscontinuityReport detect_discontinuities(std::span<const int64_t> counter,
                                           size_t max_discontinuities) {
    DiscontinuityReport rep;
    std::vector<size_t> breaks; // index of the last sample before each discontinuity
    for (size_t i = 1; i < counter.size(); ++i)
        if (counter[i] - counter[i - 1] != 1) breaks.push_back(i - 1);
    rep.discontinuities = breaks.size();
    if (breaks.empty()) return rep;

    ESYNC_INFOF("Found %zu discontinuit(ies)", breaks.size());
    if (breaks.size() > max_discontinuities) {
        ESYNC_WARNF("Found more than %zu discontinuities. Please check quality of recording.",
                    max_discontinuities);
        rep.realignable = false;
        return rep;
    }

    std::vector<SampleRange> chunks;
    // step_back[k]: the step out of chunk k into chunk k + 1 goes backward
    std::vector<bool> step_back;
    size_t start = 0;
    for (size_t b : breaks) {
        chunks.push_back({counter[start], counter[b]});
        step_back.push_back(counter[b + 1] - counter[b] < 1);
        start = b + 1;
    }
    chunks.push_back({counter[start], counter.back()});

    auto span_of = [](const SampleRange& r) { return r.last - r.first; };
    size_t major = 0;
    for (size_t k = 1; k < chunks.size(); ++k)
        if (span_of(chunks[k]) > span_of(chunks[major])) major = k;
    const SampleRange main = chunks[major];
    rep.main_range = main;
    for (size_t k = 0; k < chunks.size(); ++k)
        if (k != major && span_of(chunks[k]) == span_of(main)) rep.main_tied = true;

    std::vector<SampleRange> blocking;
    for (size_t k = 0; k < chunks.size(); ++k) {
        if (k == major) continue;
        const SampleRange& r = chunks[k];
        bool ok = !strictly_inside(r.first, main) && !strictly_inside(r.last, main);
        const bool back = (k > 0 && step_back[k - 1]) || (k < step_back.size() && step_back[k]);
        rep.residual_ranges.push_back(r);
        rep.removable.push_back(ok);
        rep.backward.push_back(back);
        if (!ok) blocking.push_back(r);
        ESYNC_DEBUGF("residual chunk [%lld, %lld] removable=%d backward=%d", (long long)r.first, (long long)r.last,
                     ok ? 1 : 0, back ? 1 : 0);
    }

    if (blocking.empty()) {
        ESYNC_INFOF("Residual chunks can be removed without affecting major chunk");
    } else {
        const int64_t main_span = span_of(main);
        if (main_span > 0)
            rep.overlap_percent = 100.0 * static_cast<double>(covered_count(blocking, main.first, main.last)) /
                                  static_cast<double>(main_span);
        ESYNC_WARNF("Residual chunks cannot be removed without affecting major chunk, overlap %.3f%%",
                    rep.overlap_percent);
    }
    return rep;
}

std::vector<std::pair<int64_t, double>> sample_interval_histogram(std::span<const int64_t> counter) {
    std::vector<std::pair<int64_t, double>> out;
    if (counter.size() < 2) return out;
    std::map<int64_t, size_t> counts;
    for (size_t i = 1; i < counter.size(); ++i) ++counts[counter[i] - counter[i - 1]];
    const double n = static_cast<double>(counter.size() - 1);
    out.reserve(counts.size());
    for (const auto& [step, c] : counts) out.emplace_back(step, static_cast<double>(c) / n);
    return out;
}

std::vector<SampleRange> droppable_residuals(const DiscontinuityReport& rep) {
    std::vector<SampleRange> out;
    if (!rep.realignable || !rep.main_range || rep.main_tied || !rep.residuals_removable()) return out;
    const SampleRange& main = *rep.main_range;
    for (size_t k = 0; k < rep.residual_ranges.size(); ++k) {
        const SampleRange& r = rep.residual_ranges[k];
        const bool disjoint = r.last < main.first || r.first > main.last;
        if (rep.backward[k] && disjoint) out.push_back(r);
    }
    return out;
}

EventStream drop_events_in_ranges(const EventStream& events, std::span<const SampleRange> ranges) {
    EventStream out;
    out.reserve(events.size());
    for (const auto& e : events) {
        bool inside = std::any_of(ranges.begin(), ranges.end(),
                                  [&](const SampleRange& r) { return r.contains(e.sample_number); });
        if (!inside) out.push_back(e);
    }
    return out;
}

} // namespace esync::align
