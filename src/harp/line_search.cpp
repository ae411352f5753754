#include "esync/harp/line_search.hpp"
#include "esync/errors.hpp"
#include "esync/log.hpp"
#include <algorithm>
#include <cmath>
#include <complex>
#include <numeric>
#include <set>
#include <string>

#include <liquid/liquid.h>

namespace esync::harp {

double chi2_survival(double chi2, double dof) {
    if (!(dof > 0.0)) return 0.0;
    if (!(chi2 > 0.0)) return 1.0;
    // regularized lower incomplete gamma P(dof/2, chi2/2)
    const float z = static_cast<float>(dof / 2.0);
    const float x = static_cast<float>(chi2 / 2.0);
    const double lnP = static_cast<double>(liquid_lnlowergammaf(z, x)) - static_cast<double>(liquid_lngammaf(z));
    double p = 1.0 - std::exp(lnP);
    if (!std::isfinite(p)) return 0.0;
    return std::clamp(p, 0.0, 1.0);
}

LineStatistics score_line(int line, std::span<const double> rising_times, const HarpConfig& cfg) {
    LineStatistics st;
    st.line = line;
    st.rising_edges = rising_times.size();
    if (rising_times.size() < 2) return st;

    std::vector<double> ts(rising_times.begin(), rising_times.end());
    std::sort(ts.begin(), ts.end());

    st.intervals.resize(ts.size() - 1);
    size_t n_short = 0;
    std::vector<double> onsets;
    for (size_t i = 1; i < ts.size(); ++i) {
        double d = ts[i] - ts[i - 1];
        st.intervals[i - 1] = d;
        if (d < cfg.short_gap_s) ++n_short;
        if (d > cfg.onset_gap_s) onsets.push_back(ts[i]);
    }
    st.short_gap_fraction = static_cast<double>(n_short) / static_cast<double>(st.intervals.size());

    // bin edges t0, t0+w, ... strictly below the last edge; the last bin is closed
    const double t0 = ts.front(), t1 = ts.back();
    for (size_t k = 0; t0 + static_cast<double>(k) * cfg.bin_width_s < t1; ++k)
        st.bin_start.push_back(t0 + static_cast<double>(k) * cfg.bin_width_s);
    if (st.bin_start.size() < 3) {
        ESYNC_DEBUGF("line %d: session too short for %.1f s bins", line, cfg.bin_width_s);
        st.bin_start.clear();
        return st;
    }
    st.bin_start.pop_back();  // the last edge closes the final full bin
    const size_t nbins = st.bin_start.size();
    const double hi = st.bin_start.back() + cfg.bin_width_s;
    st.onset_counts.assign(nbins, 0);
    for (double t : onsets) {
        if (t < t0 || t > hi) continue;
        size_t k = static_cast<size_t>((t - t0) / cfg.bin_width_s);
        if (k >= nbins) k = nbins - 1;
        ++st.onset_counts[k];
    }
    const double total = static_cast<double>(std::accumulate(st.onset_counts.begin(), st.onset_counts.end(), size_t{0}));
    const double expected = total / static_cast<double>(nbins);
    if (expected > 0.0) {
        for (size_t c : st.onset_counts) {
            double d = static_cast<double>(c) - expected;
            st.chi2 += d * d / expected;
        }
        st.p_value = chi2_survival(st.chi2, static_cast<double>(nbins - 1));
    }
    st.accepted = st.p_value > cfg.min_p_value && st.short_gap_fraction > cfg.min_short_gap_fraction;
    return st;
}

LineSearchResult select_barcode_lines(const EventStream& events, size_t stream, const HarpConfig& cfg) {
    std::set<int> lines;
    for (const auto& e : events)
        if (e.stream == stream && e.state == 1) lines.insert(e.line);

    LineSearchResult res;
    for (int line : lines) {
        std::vector<double> ts;
        for (const auto& e : events)
            if (e.stream == stream && e.state == 1 && e.line == line) ts.push_back(e.timestamp);
        LineStatistics st = score_line(line, ts, cfg);
        ESYNC_INFOF("line %d: p_uniform %.2f, short interval fraction %.2f%s", line, st.p_value,
                    st.short_gap_fraction, st.accepted ? " (candidate)" : "");
        if (st.accepted) res.candidates.push_back(line);
        res.lines.push_back(std::move(st));
    }
    if (res.candidates.empty()) ESYNC_WARNF("Harp line not detected!");
    return res;
}

int resolve_barcode_line(const LineSearchResult& result, std::optional<int> preferred) {
    const auto& c = result.candidates;
    if (preferred && std::find(c.begin(), c.end(), *preferred) != c.end()) return *preferred;
    if (c.empty()) throw BarcodeDecodeError("No Harp line found. Please check recording.");
    if (c.size() == 1) return c.front();
    std::string list;
    for (int l : c) list += (list.empty() ? "" : ", ") + std::to_string(l);
    throw AmbiguousSyncLineError("Multiple Harp lines found: " + list, c);
}

std::optional<size_t> find_stream(const Recording& rec, const std::string& pattern) {
    for (size_t i = 0; i < rec.continuous.size(); ++i)
        if (rec.continuous[i].name.find(pattern) != std::string::npos) return i;
    return std::nullopt;
}

} // namespace esync::harp
