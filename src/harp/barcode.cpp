#include "esync/harp/barcode.hpp"
#include "esync/errors.hpp"
#include "esync/log.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>

namespace esync::harp {

namespace {

// Index of the first edge after each gap.
std::vector<size_t> gap_indices(std::span<const double> times, double gap_s) {
    std::vector<size_t> gaps;
    for (size_t i = 1; i < times.size(); ++i)
        if (times[i] - times[i - 1] > gap_s) gaps.push_back(i);
    return gaps;
}

bool agrees(double t0, double v0, double t1, double v1) {
    return t1 > t0 && std::abs((v1 - v0) - (t1 - t0)) < 0.5;
}

} // namespace

std::vector<BarcodeSegment> segment_barcodes(std::span<const double> times, double gap_s) {
    const auto gaps = gap_indices(times, gap_s);
    std::vector<BarcodeSegment> segs;
    for (size_t k = 0; k + 1 < gaps.size(); ++k) segs.push_back({gaps[k], gaps[k + 1]});
    return segs;
}

uint32_t decode_barcode(std::span<const double> times, std::span<const int> states, double baud_rate) {
    if (times.size() != states.size()) throw std::invalid_argument("barcode times/states length mismatch");
    if (times.size() < 2) throw BarcodeDecodeError("barcode has fewer than 2 edges");
    if (states.front() != 0) throw BarcodeDecodeError("barcode does not start with a falling edge");
    if (states.back() != 1) throw BarcodeDecodeError("barcode does not return to idle");

    std::array<int, BARCODE_BITS> bits;
    bits.fill(1);
    size_t nbits = 0;
    for (size_t i = 0; i + 1 < times.size(); ++i) {
        if (states[i + 1] == states[i]) throw BarcodeDecodeError("repeated edge state in barcode");
        long long count = std::llround((times[i + 1] - times[i]) * baud_rate);
        if (count < 1) throw BarcodeDecodeError("edge interval shorter than one bit");
        if (nbits + static_cast<size_t>(count) > BARCODE_BITS)
            throw BarcodeDecodeError("barcode longer than " + std::to_string(BARCODE_BITS) + " bits");
        std::fill_n(bits.begin() + nbits, count, states[i]);
        nbits += static_cast<size_t>(count);
    }

    uint32_t value = 0;
    for (size_t f = 0; f < BARCODE_FRAMES; ++f) {
        const int* frame = bits.data() + f * BARCODE_FRAME_BITS;
        if (frame[0] != 0) throw BarcodeDecodeError("missing start bit in frame " + std::to_string(f));
        if (frame[BARCODE_FRAME_BITS - 1] != 1) throw BarcodeDecodeError("missing stop bit in frame " + std::to_string(f));
        uint32_t byte = 0;
        for (size_t b = 0; b < 8; ++b)
            if (frame[1 + b]) byte |= 1u << b;
        value |= byte << (8 * f);
    }
    return value;
}

BarcodeDecodeSummary decode_barcodes(std::span<const double> times, std::span<const int> states,
                                     const HarpConfig& cfg) {
    if (times.size() != states.size()) throw std::invalid_argument("barcode times/states length mismatch");
    BarcodeDecodeSummary out;
    auto segs = segment_barcodes(times, cfg.segment_gap_s);
    out.segments = segs.size();
    for (const auto& s : segs) {
        uint32_t v = 0;
        try {
            v = decode_barcode(times.subspan(s.begin, s.size()), states.subspan(s.begin, s.size()), cfg.baud_rate);
        } catch (const BarcodeDecodeError& e) {
            ++out.discarded;
            ESYNC_DEBUGF("discarding barcode at %.6f s: %s", times[s.begin], e.what());
            continue;
        }
        const double harp_s = static_cast<double>(v);
        if (!out.anchors.empty() && harp_s <= out.anchors.target_time.back()) {
            ++out.discarded;
            ESYNC_DEBUGF("discarding barcode at %.6f s: value %u does not increase", times[s.begin], v);
            continue;
        }
        out.anchors.sample_index.push_back(times[s.begin]);
        out.anchors.target_time.push_back(harp_s);
    }

    const auto gaps = gap_indices(times, cfg.segment_gap_s);
    if (!gaps.empty()) {
        auto try_outer = [&](const BarcodeSegment& r, const char* which) -> std::optional<double> {
            try {
                return static_cast<double>(decode_barcode(times.subspan(r.begin, r.size()),
                                                          states.subspan(r.begin, r.size()), cfg.baud_rate));
            } catch (const BarcodeDecodeError& e) {
                ESYNC_DEBUGF("%s barcode run at %.6f s not decoded: %s", which, times[r.begin], e.what());
                return std::nullopt;
            }
        };
        const BarcodeSegment lead{0, gaps.front()};
        const BarcodeSegment trail{gaps.back(), times.size()};
        const auto lead_v = try_outer(lead, "leading");
        const auto trail_v = try_outer(trail, "trailing");
        AnchorSet& a = out.anchors;
        if (lead_v) {
            const bool ok = !a.empty() ? agrees(times[lead.begin], *lead_v, a.sample_index.front(), a.target_time.front())
                                       : trail_v && agrees(times[lead.begin], *lead_v, times[trail.begin], *trail_v);
            if (ok) {
                a.sample_index.insert(a.sample_index.begin(), times[lead.begin]);
                a.target_time.insert(a.target_time.begin(), *lead_v);
                ++out.outer_kept;
            } else {
                ESYNC_DEBUGF("leading barcode run at %.6f s does not match its neighbour", times[lead.begin]);
            }
        }
        if (trail_v) {
            if (!a.empty() && agrees(a.sample_index.back(), a.target_time.back(), times[trail.begin], *trail_v)) {
                a.sample_index.push_back(times[trail.begin]);
                a.target_time.push_back(*trail_v);
                ++out.outer_kept;
            } else {
                ESYNC_DEBUGF("trailing barcode run at %.6f s does not match its neighbour", times[trail.begin]);
            }
        }
    }
    ESYNC_INFOF("Total Harp events: %zu (%zu discarded)", out.anchors.size(), out.discarded);
    if (out.anchors.empty())
        throw BarcodeDecodeError("no Harp barcode decoded from " + std::to_string(out.segments) + " segment(s)");
    return out;
}

void barcode_edges(const EventStream& events, size_t stream, int line,
                   std::vector<double>& times, std::vector<int>& states) {
    std::vector<const Event*> sel;
    for (const auto& e : events)
        if (e.stream == stream && e.line == line) sel.push_back(&e);
    std::stable_sort(sel.begin(), sel.end(), [](const Event* a, const Event* b) { return a->timestamp < b->timestamp; });
    times.clear();
    states.clear();
    times.reserve(sel.size());
    states.reserve(sel.size());
    for (const Event* e : sel) {
        times.push_back(e->timestamp);
        states.push_back(e->state);
    }
}

} // namespace esync::harp
