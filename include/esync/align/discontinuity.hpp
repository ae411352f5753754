#pragma once
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>
#include "esync/types.hpp"

namespace esync::align {

// Inclusive range of counter values.
struct SampleRange {
    int64_t first{0};
    int64_t last{0};
    bool contains(int64_t v) const { return v >= first && v <= last; }
};

struct DiscontinuityReport {
    bool realignable{true};
    size_t discontinuities{0};
    // Contiguous chunk with the largest counter span; unset when the counter
    // is continuous or when there are too many discontinuities to classify.
    std::optional<SampleRange> main_range;
    std::vector<SampleRange> residual_ranges;
    // removable[i]: neither bound of residual_ranges[i] lies strictly inside main_range.
    std::vector<bool> removable;
    // backward[i]: residual_ranges[i] is entered or left through a counter step < 1
    // (counter restart or replayed buffer), not only through forward gaps.
    std::vector<bool> backward;
    // Another chunk has the same counter span as the main one.
    bool main_tied{false};
    // Share (%) of the main range covered by residual chunks that are not removable.
    double overlap_percent{0.0};

    bool residuals_removable() const;
};

// Scan a raw sample counter for steps != 1. Up to 'max_discontinuities'
// steps the counter is split into chunks and classified; above it the
// report is marked non-realignable. Never throws on bad data: the caller
// decides what to do with a non-realignable report.
DiscontinuityReport detect_discontinuities(std::span<const int64_t> counter,
                                           size_t max_discontinuities = 2);

// Fraction of each distinct consecutive counter step, sorted by step.
std::vector<std::pair<int64_t, double>> sample_interval_histogram(std::span<const int64_t> counter);

// Residual ranges whose sync events may be dropped: empty unless the report
// is realignable, every residual is removable and the main chunk is
// unambiguous. Of those, only chunks reached or left through a backward step
// and sharing no counter value with the main range are returned. A forward
// gap alone means dropped samples, and the edges on both sides of it are valid.
std::vector<SampleRange> droppable_residuals(const DiscontinuityReport& rep);

// Events whose sample number lies outside every range, original order kept.
EventStream drop_events_in_ranges(const EventStream& events, std::span<const SampleRange> ranges);

} // namespace esync::align
