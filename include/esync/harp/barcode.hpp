#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "esync/config.hpp"
#include "esync/types.hpp"

namespace esync::harp {

// Harp clock barcode: the seconds counter sent as 4 UART frames
// (start bit 0, 8 data bits LSB first, stop bit 1), bytes little-endian.
inline constexpr size_t BARCODE_FRAMES = 4;
inline constexpr size_t BARCODE_FRAME_BITS = 10;
inline constexpr size_t BARCODE_BITS = BARCODE_FRAMES * BARCODE_FRAME_BITS;

// Edge index range [begin, end) of one barcode.
struct BarcodeSegment {
    size_t begin{0};
    size_t end{0};
    size_t size() const { return end - begin; }
};

// Split edge times at gaps longer than 'gap_s'. Only runs bounded by a gap on
// both sides are returned; the leading and trailing runs may be truncated
// (see decode_barcodes).
std::vector<BarcodeSegment> segment_barcodes(std::span<const double> times, double gap_s);

// Decode one barcode from its edges. The line holds states[i] from times[i]
// until times[i+1] and idles high after the last edge.
// Throws BarcodeDecodeError when the edges do not form 4 valid frames.
uint32_t decode_barcode(std::span<const double> times, std::span<const int> states, double baud_rate);

struct BarcodeDecodeSummary {
    AnchorSet anchors;       // (local time of first edge, decoded Harp seconds)
    size_t segments{0};
    size_t discarded{0};
    size_t outer_kept{0};    // leading/trailing runs accepted
};

// Decode every segment of a barcode line, discarding malformed ones.
// The runs before the first gap and after the last one are kept only when
// they decode and their value agrees with the neighbouring barcode (values
// count seconds, so the value step must match the local time step).
// 'times'/'states' are all edges of the line in time order.
// Throws BarcodeDecodeError when nothing decodes.
BarcodeDecodeSummary decode_barcodes(std::span<const double> times, std::span<const int> states,
                                     const HarpConfig& cfg);

// Edges of 'line' on 'stream' in time order.
void barcode_edges(const EventStream& events, size_t stream, int line,
                   std::vector<double>& times, std::vector<int>& states);

} // namespace esync::harp
