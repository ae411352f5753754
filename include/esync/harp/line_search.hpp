#pragma once
#include <optional>
#include <span>
#include <vector>
#include "esync/config.hpp"
#include "esync/types.hpp"

namespace esync::harp {

struct LineStatistics {
    int line{0};
    size_t rising_edges{0};
    // Chi-square goodness of fit of barcode onsets against a uniform rate.
    double chi2{0.0};
    double p_value{0.0};
    // Share of inter-edge gaps shorter than the short-gap threshold.
    double short_gap_fraction{0.0};
    bool accepted{false};
    // Diagnostics: onset counts per time bin (bin_start[k] .. bin_start[k] + width).
    std::vector<double> bin_start;
    std::vector<size_t> onset_counts;
    // Diagnostics: inter-edge intervals (s).
    std::vector<double> intervals;
};

struct LineSearchResult {
    std::vector<LineStatistics> lines;  // one per scanned line, ascending line id
    std::vector<int> candidates;        // accepted lines
};

// Upper-tail probability of a chi-square statistic with 'dof' degrees of freedom.
double chi2_survival(double chi2, double dof);

// Score one line's rising-edge times (s).
LineStatistics score_line(int line, std::span<const double> rising_times, const HarpConfig& cfg);

// Scan every line with rising edges on 'stream' and keep the lines whose
// edges look like a periodic barcode: onsets uniform over the session and
// most gaps short.
LineSearchResult select_barcode_lines(const EventStream& events, size_t stream, const HarpConfig& cfg);

// Pick the line to decode. 'preferred' wins when it is a candidate; zero
// candidates throws BarcodeDecodeError, several throws AmbiguousSyncLineError.
int resolve_barcode_line(const LineSearchResult& result, std::optional<int> preferred = std::nullopt);

// First stream whose name contains 'pattern'.
std::optional<size_t> find_stream(const Recording& rec, const std::string& pattern);

} // namespace esync::harp
