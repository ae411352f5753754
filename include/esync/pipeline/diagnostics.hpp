#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "esync/harp/line_search.hpp"
#include "esync/types.hpp"

namespace esync::pipeline {

struct StreamAlignmentDiagnostics {
    std::string stream_name;
    bool reference{false};
    // Fraction of each sample counter step.
    std::vector<std::pair<int64_t, double>> interval_histogram;
    // Inter-edge interval differences to the reference stream (ms), as
    // recorded and after remapping.
    std::vector<double> residual_before_ms;
    std::vector<double> residual_after_ms;
};

// Receives the data behind the QC figures. Every callback is optional; the
// alignment result never depends on whether a sink is attached.
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;
    virtual void on_stream_alignment(const RecordingId&, const StreamAlignmentDiagnostics&) {}
    virtual void on_line_search(const RecordingId&, const harp::LineSearchResult&) {}
    virtual void on_harp_anchors(const RecordingId&, const AnchorSet&) {}
};

// Writes one CSV file per callback into 'dir'.
class CsvDiagnosticsWriter : public DiagnosticsSink {
public:
    explicit CsvDiagnosticsWriter(std::filesystem::path dir);

    void on_stream_alignment(const RecordingId& id, const StreamAlignmentDiagnostics& d) override;
    void on_line_search(const RecordingId& id, const harp::LineSearchResult& r) override;
    void on_harp_anchors(const RecordingId& id, const AnchorSet& a) override;

    const std::vector<std::filesystem::path>& written() const { return written_; }

private:
    std::filesystem::path file_for(const RecordingId& id, const std::string& what) const;

    std::filesystem::path dir_;
    std::vector<std::filesystem::path> written_;
};

} // namespace esync::pipeline
