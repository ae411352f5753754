#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "esync/align/discontinuity.hpp"
#include "esync/align/reconcile.hpp"
#include "esync/config.hpp"
#include "esync/pipeline/diagnostics.hpp"
#include "esync/types.hpp"

namespace esync::pipeline {

struct StreamOutcome {
    std::string stream_name;
    bool aligned{false};
    std::string error;
    size_t anchors{0};
    align::Reconciliation reconciliation;
    align::DiscontinuityReport discontinuities;
    size_t residual_events_dropped{0};
    // An archive already existed: the replaced values were derived from a
    // previously written "current" file.
    bool rederived{false};
};

struct RecordingReport {
    RecordingId id;
    AlignMethod method{AlignMethod::Local};
    bool ok{true};
    std::string error;
    std::optional<int> harp_line;
    std::vector<int> harp_candidates;
    std::vector<StreamOutcome> streams;

    bool all_aligned() const;
};

// Called with the candidate lines when more than one line passes the barcode
// test; returns the line to use, or nullopt to give up.
using LinePrompt = std::function<std::optional<int>(const RecordingId&, const std::vector<int>&)>;

// Align every stream of 'rec' to the reference stream's sync edges and
// rewrite continuous and TTL timestamps on disk. Stream failures are
// recorded in the report; recording-level failures (reference stream
// unusable) throw.
RecordingReport align_recording_local(const Recording& rec, const AlignConfig& cfg,
                                      DiagnosticsSink* diag = nullptr);

// Translate every stream's current timestamps into Harp time using the
// barcode line of the NI-DAQ stream. Throws BarcodeDecodeError,
// AmbiguousSyncLineError or DataIntegrityError for the recording.
RecordingReport align_recording_harp(const Recording& rec, const AlignConfig& cfg,
                                     DiagnosticsSink* diag = nullptr);

// Run cfg.method over every recording under 'root'. Failures are confined to
// the recording they occur in; only a missing root (MissingFileError) or an
// invalid configuration (std::invalid_argument) aborts the batch.
std::vector<RecordingReport> align_session(const std::filesystem::path& root, const AlignConfig& cfg,
                                           DiagnosticsSink* diag = nullptr, const LinePrompt& prompt = {});

} // namespace esync::pipeline
