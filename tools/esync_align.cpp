#include "esync/config.hpp"
#include "esync/errors.hpp"
#include "esync/log.hpp"
#include "esync/pipeline/align.hpp"
#include "esync/pipeline/diagnostics.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace esync;

static void usage(const char* a0) {
    std::fprintf(stderr,
        "Usage: %s --dir <session> [--method local|harp|none] [--ref 0] [--sync-line 1] [--flip-nidaq] [--invert <pattern>]... [--harp-line N] [--drop-residuals] [--interactive] [--diag-dir <dir>] [--log <file>] [--quiet]\n",
        a0);
}

static std::optional<int> ask_line(const RecordingId& id, const std::vector<int>& candidates) {
    std::fprintf(stderr, "%s: more than one Harp line found:", to_string(id).c_str());
    for (int c : candidates) std::fprintf(stderr, " %d", c);
    std::fprintf(stderr, "\nPlease specify line to use: ");
    std::string answer;
    if (!std::getline(std::cin, answer)) return std::nullopt;
    try {
        int line = std::stoi(answer);
        for (int c : candidates)
            if (c == line) return line;
    } catch (const std::exception&) {
    }
    std::fprintf(stderr, "'%s' is not one of the candidate lines\n", answer.c_str());
    return std::nullopt;
}

static void print_report(const pipeline::RecordingReport& r) {
    std::printf("%s [%s]: %s\n", to_string(r.id).c_str(), to_string(r.method),
                r.method == AlignMethod::None ? "skipped" : (r.all_aligned() ? "aligned" : "FAILED"));
    if (!r.ok) std::printf("  error: %s\n", r.error.c_str());
    if (r.harp_line) std::printf("  harp line: %d\n", *r.harp_line);
    if (!r.ok && r.harp_candidates.size() > 1) {
        std::printf("  candidate lines:");
        for (int c : r.harp_candidates) std::printf(" %d", c);
        std::printf(" (use --harp-line)\n");
    }
    for (const auto& s : r.streams) {
        std::printf("  %-32s %s anchors=%zu", s.stream_name.c_str(), s.aligned ? "ok  " : "FAIL", s.anchors);
        if (s.reconciliation.side != align::TrimSide::None)
            std::printf(" trimmed %s edge of %s", align::to_string(s.reconciliation.end),
                        align::to_string(s.reconciliation.side));
        if (s.residual_events_dropped) std::printf(" residual_events_dropped=%zu", s.residual_events_dropped);
        if (!s.discontinuities.realignable) std::printf(" discontinuities=%zu", s.discontinuities.discontinuities);
        if (s.rederived) std::printf(" (re-derived from previous output)");
        std::printf("\n");
        if (!s.error.empty()) std::printf("    %s\n", s.error.c_str());
    }
}

int main(int argc, char** argv) {
    AlignConfig cfg;
    std::string dir, diag_dir, log_path;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--dir" && i+1 < argc) dir = argv[++i];
            else if (a == "--method" && i+1 < argc) {
                auto m = parse_align_method(argv[++i]);
                if (!m) { usage(argv[0]); return 2; }
                cfg.method = *m;
            }
            else if (a == "--ref" && i+1 < argc) cfg.reference_stream = std::stoul(argv[++i]);
            else if (a == "--sync-line" && i+1 < argc) cfg.sync_line = std::stoi(argv[++i]);
            else if (a == "--flip-nidaq") cfg.inverted_streams.push_back(cfg.harp.stream_pattern);
            else if (a == "--invert" && i+1 < argc) cfg.inverted_streams.push_back(argv[++i]);
            else if (a == "--harp-line" && i+1 < argc) cfg.harp.line = std::stoi(argv[++i]);
            else if (a == "--drop-residuals") cfg.drop_residual_chunks = true;
            else if (a == "--interactive") cfg.interactive = true;
            else if (a == "--diag-dir" && i+1 < argc) diag_dir = argv[++i];
            else if (a == "--log" && i+1 < argc) log_path = argv[++i];
            else if (a == "--quiet") quiet = true;
            else { usage(argv[0]); return 2; }
        }
        validate_config(cfg);
    } catch (const std::logic_error& e) {
        // std::stoi family and validate_config
        std::fprintf(stderr, "%s\n", e.what());
        usage(argv[0]);
        return 2;
    }
    if (dir.empty()) { usage(argv[0]); return 2; }

    esync::log::set_quiet(quiet);
    if (!log_path.empty()) esync::log::set_file(log_path);

    std::unique_ptr<pipeline::CsvDiagnosticsWriter> diag;
    std::vector<pipeline::RecordingReport> reports;
    try {
        if (!diag_dir.empty()) diag = std::make_unique<pipeline::CsvDiagnosticsWriter>(diag_dir);
        reports = pipeline::align_session(dir, cfg, diag.get(), ask_line);
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    bool all_ok = true;
    for (const auto& r : reports) {
        print_report(r);
        if (r.method != AlignMethod::None && !r.all_aligned()) all_ok = false;
    }
    if (reports.empty()) std::printf("No recordings found under %s\n", dir.c_str());
    if (diag) std::printf("Diagnostics: %zu file(s) in %s\n", diag->written().size(), diag_dir.c_str());
    return all_ok ? 0 : 1;
}
