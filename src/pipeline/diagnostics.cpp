#include "esync/pipeline/diagnostics.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace fs = std::filesystem;

namespace esync::pipeline {

CsvDiagnosticsWriter::CsvDiagnosticsWriter(fs::path dir) : dir_(std::move(dir)) {
    fs::create_directories(dir_);
}

fs::path CsvDiagnosticsWriter::file_for(const RecordingId& id, const std::string& what) const {
    std::string name = "node" + id.record_node + "_exp" + std::to_string(id.experiment_index) + "_rec" +
                       std::to_string(id.recording_index) + "_" + what + ".csv";
    std::replace_if(name.begin(), name.end(), [](char c) { return c == '/' || c == ' ' || c == '\\'; }, '_');
    return dir_ / name;
}

static std::ofstream open_csv(const fs::path& p) {
    std::ofstream f(p, std::ios::trunc);
    if (!f) throw std::runtime_error("Failed to create diagnostics file: " + p.string());
    f << std::setprecision(12);
    return f;
}

void CsvDiagnosticsWriter::on_stream_alignment(const RecordingId& id, const StreamAlignmentDiagnostics& d) {
    auto p = file_for(id, "alignment_" + d.stream_name);
    auto f = open_csv(p);
    f << "kind,index,value,extra\n";
    for (const auto& [step, frac] : d.interval_histogram) f << "interval," << step << ',' << frac << ",\n";
    for (size_t i = 0; i < d.residual_before_ms.size(); ++i) f << "residual_before_ms," << i << ',' << d.residual_before_ms[i] << ",\n";
    for (size_t i = 0; i < d.residual_after_ms.size(); ++i) f << "residual_after_ms," << i << ',' << d.residual_after_ms[i] << ",\n";
    written_.push_back(p);
}

void CsvDiagnosticsWriter::on_line_search(const RecordingId& id, const harp::LineSearchResult& r) {
    auto p = file_for(id, "harp_line_search");
    auto f = open_csv(p);
    f << "line,kind,x,value\n";
    for (const auto& st : r.lines) {
        f << st.line << ",p_value,," << st.p_value << '\n';
        f << st.line << ",short_gap_fraction,," << st.short_gap_fraction << '\n';
        f << st.line << ",accepted,," << (st.accepted ? 1 : 0) << '\n';
        for (size_t k = 0; k < st.onset_counts.size(); ++k)
            f << st.line << ",onsets," << st.bin_start[k] << ',' << st.onset_counts[k] << '\n';
        for (size_t k = 0; k < st.intervals.size(); ++k)
            f << st.line << ",interval," << k << ',' << st.intervals[k] << '\n';
    }
    written_.push_back(p);
}

void CsvDiagnosticsWriter::on_harp_anchors(const RecordingId& id, const AnchorSet& a) {
    auto p = file_for(id, "harp_anchors");
    auto f = open_csv(p);
    f << "local_time,harp_time\n";
    for (size_t k = 0; k < a.size(); ++k) f << a.sample_index[k] << ',' << a.target_time[k] << '\n';
    written_.push_back(p);
}

} // namespace esync::pipeline
