#include "esync/pipeline/align.hpp"
#include "esync/align/anchors.hpp"
#include "esync/align/remap.hpp"
#include "esync/errors.hpp"
#include "esync/harp/barcode.hpp"
#include "esync/harp/line_search.hpp"
#include "esync/io/archive.hpp"
#include "esync/io/npy.hpp"
#include "esync/io/open_ephys.hpp"
#include "esync/log.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace esync::pipeline {

bool RecordingReport::all_aligned() const {
    return ok && std::all_of(streams.begin(), streams.end(), [](const StreamOutcome& s) { return s.aligned; });
}

namespace {

// Discontinuity scan of the stream counter, then removal of sync events that
// fall in residual chunks when that is safe.
EventStream apply_residual_policy(EventStream ev, const ContinuousStream& s, const AlignConfig& cfg,
                                  StreamOutcome& out) {
    out.discontinuities = align::detect_discontinuities(s.sample_numbers, cfg.max_discontinuities);
    const auto& rep = out.discontinuities;
    if (!rep.realignable) {
        ESYNC_WARNF("%s: %zu counter discontinuities, residual chunks left in place", s.name.c_str(),
                    rep.discontinuities);
        return ev;
    }
    if (rep.residual_ranges.empty() || !cfg.drop_residual_chunks) return ev;
    if (!rep.residuals_removable()) {
        ESYNC_WARNF("%s: residual chunks overlap the main chunk (%.3f%%), sync events kept", s.name.c_str(),
                    rep.overlap_percent);
        return ev;
    }
    const auto ranges = align::droppable_residuals(rep);
    if (ranges.size() < rep.residual_ranges.size())
        ESYNC_WARNF("%s: %zu residual chunk(s) bounded only by forward gaps or ambiguous, sync events kept",
                    s.name.c_str(), rep.residual_ranges.size() - ranges.size());
    if (ranges.empty()) return ev;
    const size_t before = ev.size();
    ev = align::drop_events_in_ranges(ev, ranges);
    out.residual_events_dropped = before - ev.size();
    ESYNC_INFOF("%s: dropped %zu sync event(s) in residual chunks", s.name.c_str(), out.residual_events_dropped);
    return ev;
}

std::vector<double> interval_residual_ms(const std::vector<double>& a, const std::vector<double>& b) {
    std::vector<double> out;
    const size_t n = std::min(a.size(), b.size());
    for (size_t k = 1; k < n; ++k) out.push_back(((a[k] - a[k - 1]) - (b[k] - b[k - 1])) * 1000.0);
    return out;
}

void record_write(io::ArchiveStatus st, StreamOutcome& out, const fs::path& dir) {
    if (st == io::ArchiveStatus::AlreadyArchived) {
        out.rederived = true;
        ESYNC_WARNF("%s was already archived; current values were re-derived from a previous run's output",
                    dir.string().c_str());
    }
}

// Remap the TTL sample numbers of one stream (file order) and replace its event timestamps.
void rewrite_events_by_sample(const Recording& rec, size_t stream, const AnchorSet& anchors,
                              const AlignConfig& cfg, StreamOutcome& out) {
    const fs::path dir = io::events_dir(rec, stream);
    if (!fs::is_directory(dir)) return;
    auto raw = io::read_npy_i64(dir / "sample_numbers.npy");
    auto ts = align::remap(raw, anchors);
    ESYNC_INFOF("Updating stream event timestamps...");
    record_write(io::archive_and_replace(dir, ts, cfg.timestamp_filename, cfg.archive_filename), out, dir);
}

void fail(StreamOutcome& out, const std::exception& e) {
    out.aligned = false;
    out.error = e.what();
    ESYNC_ERRORF("%s: %s", out.stream_name.c_str(), e.what());
}

// A failing sink is logged and never changes the alignment outcome.
template <typename Call>
void notify(DiagnosticsSink* diag, const RecordingId& id, Call&& call) {
    if (!diag) return;
    try {
        call(*diag);
    } catch (const std::runtime_error& e) {
        ESYNC_WARNF("%s: diagnostics not written: %s", to_string(id).c_str(), e.what());
    }
}

} // namespace

RecordingReport align_recording_local(const Recording& rec, const AlignConfig& cfg, DiagnosticsSink* diag) {
    RecordingReport report;
    report.id = rec.id;
    report.method = AlignMethod::Local;
    ESYNC_INFOF("Temporal alignment of %s", to_string(rec.id).c_str());

    const size_t r = cfg.reference_stream;
    if (r >= rec.continuous.size())
        throw DataIntegrityError("reference stream index " + std::to_string(r) + " out of range (" +
                                 std::to_string(rec.continuous.size()) + " streams)");
    const ContinuousStream& ref = rec.continuous[r];
    if (!ref.load_error.empty()) throw DataIntegrityError("reference stream unavailable: " + ref.load_error);

    ESYNC_INFOF("Processing stream: %s", ref.name.c_str());
    StreamOutcome ref_out;
    ref_out.stream_name = ref.name;
    const bool ref_inv = is_inverted_stream(cfg, ref.name);
    if (ref_inv) ESYNC_INFOF("Flipping %s as main stream...", ref.name.c_str());
    EventStream ref_events = align::select_sync_events(rec.events, r, cfg.sync_line, ref_inv);
    ref_events = apply_residual_policy(std::move(ref_events), ref, cfg, ref_out);
    const align::SyncEdges ref_edges = align::to_sync_edges(ref_events, ref.sample_rate);
    const AnchorSet ref_anchors = align::build_anchor_set(ref_edges);
    const int64_t origin = ref_edges.sample_numbers.front();
    ref_out.anchors = ref_anchors.size();
    ESYNC_INFOF("Total events for %s: %zu", ref.name.c_str(), ref_edges.size());

    try {
        auto ts = align::remap(ref.sample_numbers, ref_anchors);
        ESYNC_INFOF("Updating stream continuous timestamps...");
        const fs::path dir = io::continuous_dir(rec, r);
        record_write(io::archive_and_replace(dir, ts, cfg.timestamp_filename, cfg.archive_filename), ref_out, dir);
        rewrite_events_by_sample(rec, r, ref_anchors, cfg, ref_out);
    } catch (const std::runtime_error& e) {
        // other streams are left untouched
        fail(ref_out, e);
        report.ok = false;
        report.error = "reference stream not written: " + ref_out.error;
        report.streams.push_back(std::move(ref_out));
        return report;
    }
    ref_out.aligned = true;
    notify(diag, rec.id, [&](DiagnosticsSink& sink) {
        StreamAlignmentDiagnostics d;
        d.stream_name = ref.name;
        d.reference = true;
        d.interval_histogram = align::sample_interval_histogram(ref.sample_numbers);
        sink.on_stream_alignment(rec.id, d);
    });

    std::vector<StreamOutcome> others;
    for (size_t i = 0; i < rec.continuous.size(); ++i) {
        if (i == r) continue;
        const ContinuousStream& s = rec.continuous[i];
        StreamOutcome out;
        out.stream_name = s.name;
        ESYNC_INFOF("Processing stream: %s", s.name.c_str());
        try {
            if (!s.load_error.empty()) throw Error("stream unavailable: " + s.load_error);
            const bool inv = is_inverted_stream(cfg, s.name);
            if (inv) ESYNC_INFOF("Flipping %s...", s.name.c_str());
            EventStream ev = align::select_sync_events(rec.events, i, cfg.sync_line, inv);
            ev = apply_residual_policy(std::move(ev), s, cfg, out);

            align::SyncEdges main_edges = ref_edges;  // untrimmed reference for every stream
            align::SyncEdges edges = align::to_sync_edges(ev, s.sample_rate);
            out.reconciliation = align::reconcile_anchor_counts(main_edges, edges, cfg.trim_offset_threshold_s);
            ESYNC_INFOF("After removal: %zu local times, %zu main times", edges.size(), main_edges.size());

            AnchorSet anchors;
            anchors.target_time = align::build_anchor_set(main_edges, origin).target_time;
            anchors.sample_index.assign(edges.sample_numbers.begin(), edges.sample_numbers.end());
            align::check_anchors(anchors.sample_index, anchors.target_time);
            out.anchors = anchors.size();

            auto ts = align::remap(s.sample_numbers, anchors);
            ESYNC_INFOF("Updating stream continuous timestamps...");
            const fs::path dir = io::continuous_dir(rec, i);
            record_write(io::archive_and_replace(dir, ts, cfg.timestamp_filename, cfg.archive_filename), out, dir);
            rewrite_events_by_sample(rec, i, anchors, cfg, out);
            out.aligned = true;

            notify(diag, rec.id, [&](DiagnosticsSink& sink) {
                StreamAlignmentDiagnostics d;
                d.stream_name = s.name;
                d.interval_histogram = align::sample_interval_histogram(s.sample_numbers);
                d.residual_before_ms = interval_residual_ms(edges.event_times, main_edges.event_times);
                d.residual_after_ms = interval_residual_ms(align::remap(edges.sample_numbers, anchors),
                                                           anchors.target_time);
                sink.on_stream_alignment(rec.id, d);
            });
        } catch (const std::runtime_error& e) {
            fail(out, e);
        }
        others.push_back(std::move(out));
    }

    report.streams.push_back(std::move(ref_out));
    for (auto& o : others) report.streams.push_back(std::move(o));
    return report;
}

RecordingReport align_recording_harp(const Recording& rec, const AlignConfig& cfg, DiagnosticsSink* diag) {
    RecordingReport report;
    report.id = rec.id;
    report.method = AlignMethod::Harp;
    ESYNC_INFOF("Harp alignment of %s", to_string(rec.id).c_str());

    auto daq = harp::find_stream(rec, cfg.harp.stream_pattern);
    if (!daq) throw DataIntegrityError("no stream matching '" + cfg.harp.stream_pattern + "' carries a Harp line");

    const harp::LineSearchResult search = harp::select_barcode_lines(rec.events, *daq, cfg.harp);
    report.harp_candidates = search.candidates;
    notify(diag, rec.id, [&](DiagnosticsSink& sink) { sink.on_line_search(rec.id, search); });
    const int line = harp::resolve_barcode_line(search, cfg.harp.line);
    report.harp_line = line;
    ESYNC_INFOF("Harp line detected: %d", line);

    std::vector<double> times;
    std::vector<int> states;
    harp::barcode_edges(rec.events, *daq, line, times, states);
    const harp::BarcodeDecodeSummary decoded = harp::decode_barcodes(times, states, cfg.harp);
    const AnchorSet& anchors = decoded.anchors;
    align::check_anchors(anchors.sample_index, anchors.target_time);
    notify(diag, rec.id, [&](DiagnosticsSink& sink) { sink.on_harp_anchors(rec.id, anchors); });

    for (size_t i = 0; i < rec.continuous.size(); ++i) {
        const ContinuousStream& s = rec.continuous[i];
        StreamOutcome out;
        out.stream_name = s.name;
        out.anchors = anchors.size();
        try {
            if (!s.load_error.empty()) throw Error("stream unavailable: " + s.load_error);
            auto ts = align::remap(s.timestamps, anchors);
            const fs::path dir = io::continuous_dir(rec, i);
            record_write(io::archive_and_replace(dir, ts, cfg.timestamp_filename, cfg.harp.archive_filename), out, dir);

            const fs::path edir = io::events_dir(rec, i);
            if (fs::is_directory(edir)) {
                auto ev_ts = io::read_npy_f64(edir / cfg.timestamp_filename);
                auto ev_harp = align::remap(ev_ts, anchors);
                record_write(io::archive_and_replace(edir, ev_harp, cfg.timestamp_filename, cfg.harp.archive_filename),
                             out, edir);
            }
            out.aligned = true;
        } catch (const std::runtime_error& e) {
            fail(out, e);
        }
        report.streams.push_back(std::move(out));
    }
    return report;
}

namespace {

RecordingReport run_harp(const fs::path& dir, const AlignConfig& cfg, DiagnosticsSink* diag,
                         const LinePrompt& prompt) {
    // re-read: local alignment has just rewritten the timestamps
    Recording rec = io::load_recording(dir, cfg.timestamp_filename);
    try {
        return align_recording_harp(rec, cfg, diag);
    } catch (const AmbiguousSyncLineError& e) {
        if (!cfg.interactive || !prompt) throw;
        ESYNC_WARNF("%s", e.what());
        auto chosen = prompt(rec.id, e.candidates);
        if (!chosen) throw;
        ESYNC_INFOF("Harp line selected: %d", *chosen);
        AlignConfig again = cfg;
        again.harp.line = *chosen;
        return align_recording_harp(rec, again, diag);
    }
}

RecordingReport failed_report(const fs::path& dir, AlignMethod m, const std::exception& e) {
    RecordingReport rep;
    rep.id = io::recording_id(dir);
    rep.method = m;
    rep.ok = false;
    rep.error = e.what();
    ESYNC_ERRORF("%s: %s", to_string(rep.id).c_str(), e.what());
    return rep;
}

} // namespace

std::vector<RecordingReport> align_session(const fs::path& root, const AlignConfig& cfg, DiagnosticsSink* diag,
                                           const LinePrompt& prompt) {
    validate_config(cfg);
    const auto dirs = io::find_recordings(root);
    if (dirs.empty()) ESYNC_WARNF("no recordings found under %s", root.string().c_str());

    std::vector<RecordingReport> reports;
    for (const auto& dir : dirs) {
        if (cfg.method == AlignMethod::None) {
            RecordingReport rep;
            rep.id = io::recording_id(dir);
            rep.method = AlignMethod::None;
            reports.push_back(std::move(rep));
            continue;
        }
        try {
            Recording rec = io::load_recording(dir, cfg.timestamp_filename);
            reports.push_back(align_recording_local(rec, cfg, diag));
        } catch (const std::runtime_error& e) {
            reports.push_back(failed_report(dir, AlignMethod::Local, e));
            continue;
        }
        if (cfg.method != AlignMethod::Harp || !reports.back().ok) continue;

        try {
            reports.push_back(run_harp(dir, cfg, diag, prompt));
        } catch (const AmbiguousSyncLineError& e) {
            RecordingReport rep = failed_report(dir, AlignMethod::Harp, e);
            rep.harp_candidates = e.candidates;
            reports.push_back(std::move(rep));
        } catch (const std::runtime_error& e) {
            reports.push_back(failed_report(dir, AlignMethod::Harp, e));
        }
    }
    return reports;
}

} // namespace esync::pipeline
