#include "esync/align/remap.hpp"
#include "esync/errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace esync::align {

void check_anchors(std::span<const double> anchor_index, std::span<const double> anchor_time) {
    if (anchor_index.size() != anchor_time.size())
        throw std::invalid_argument("anchor index/time length mismatch");
    if (anchor_index.size() < 2)
        throw DataIntegrityError("cannot remap with " + std::to_string(anchor_index.size()) +
                                 " anchor point(s); at least 2 are required");
    for (size_t k = 1; k < anchor_index.size(); ++k)
        if (!(anchor_index[k] > anchor_index[k - 1]))
            throw DataIntegrityError("anchor indices not strictly increasing at position " + std::to_string(k));
}

namespace {

template <typename T>
std::vector<double> remap_impl(std::span<const T> raw,
                               std::span<const double> ai,
                               std::span<const double> at) {
    check_anchors(ai, at);
    const size_t last_seg = ai.size() - 2;
    std::vector<double> out(raw.size());
    size_t seg = 0;
    for (size_t n = 0; n < raw.size(); ++n) {
        const double x = static_cast<double>(raw[n]);
        // sequential input mostly stays in the same segment
        bool in_seg = (seg == 0 || x >= ai[seg]) && (seg == last_seg || x < ai[seg + 1]);
        if (!in_seg) {
            auto it = std::upper_bound(ai.begin(), ai.end(), x);
            size_t k = (it == ai.begin()) ? 0 : static_cast<size_t>(it - ai.begin()) - 1;
            seg = std::min(k, last_seg);
        }
        const double x0 = ai[seg], x1 = ai[seg + 1];
        const double y0 = at[seg], y1 = at[seg + 1];
        out[n] = y0 + (x - x0) / (x1 - x0) * (y1 - y0);
    }
    return out;
}

} // namespace

std::vector<double> remap(std::span<const double> raw,
                          std::span<const double> anchor_index,
                          std::span<const double> anchor_time) {
    return remap_impl<double>(raw, anchor_index, anchor_time);
}

std::vector<double> remap(std::span<const int64_t> raw,
                          std::span<const double> anchor_index,
                          std::span<const double> anchor_time) {
    return remap_impl<int64_t>(raw, anchor_index, anchor_time);
}

} // namespace esync::align
