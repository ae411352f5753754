#pragma once
#include <cstdint>
#include <span>
#include <vector>
#include "esync/types.hpp"

namespace esync::align {

// Piecewise-linear map of 'raw' through the anchors (anchor_index[k] -> anchor_time[k]).
// Values between two anchors are interpolated on that segment; values beyond
// the first/last anchor are extrapolated with the slope of the nearest pair.
// Output has the same length as 'raw' and is non-decreasing whenever 'raw'
// and 'anchor_time' are.
// Throws DataIntegrityError for fewer than two anchors or anchor indices that
// are not strictly increasing, std::invalid_argument for mismatched lengths.
std::vector<double> remap(std::span<const double> raw,
                          std::span<const double> anchor_index,
                          std::span<const double> anchor_time);

std::vector<double> remap(std::span<const int64_t> raw,
                          std::span<const double> anchor_index,
                          std::span<const double> anchor_time);

inline std::vector<double> remap(std::span<const double> raw, const AnchorSet& anchors) {
    return remap(raw, anchors.sample_index, anchors.target_time);
}

inline std::vector<double> remap(std::span<const int64_t> raw, const AnchorSet& anchors) {
    return remap(raw, anchors.sample_index, anchors.target_time);
}

// Throws like remap() when the anchors cannot define a map.
void check_anchors(std::span<const double> anchor_index, std::span<const double> anchor_time);

} // namespace esync::align
