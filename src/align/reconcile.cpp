#include "esync/align/reconcile.hpp"
#include "esync/errors.hpp"
#include "esync/log.hpp"
#include <cmath>
#include <string>

namespace esync::align {

Reconciliation reconcile_anchor_counts(SyncEdges& reference, SyncEdges& candidate,
                                       double offset_threshold_s) {
    Reconciliation r;
    r.reference_count = reference.size();
    r.candidate_count = candidate.size();
    if (reference.empty() || candidate.empty())
        throw DataIntegrityError("no sync edges to reconcile (reference " + std::to_string(reference.size()) +
                                 ", candidate " + std::to_string(candidate.size()) + ")");
    r.first_edge_offset_s = std::abs(reference.first_time() - candidate.first_time());
    if (reference.size() == candidate.size()) {
        ESYNC_DEBUGF("sync edge counts match (%zu)", reference.size());
        return r;
    }

    ESYNC_INFOF("Number of events in main and current stream are not equal (%zu vs %zu), first edges off by %.3f s",
                reference.size(), candidate.size(), r.first_edge_offset_s);
    SyncEdges& longer = reference.size() > candidate.size() ? reference : candidate;
    r.side = (&longer == &reference) ? TrimSide::Reference : TrimSide::Candidate;
    if (r.first_edge_offset_s > offset_threshold_s) {
        // too far apart to be the same edge
        longer.drop_front();
        r.end = TrimEnd::Front;
    } else {
        longer.drop_back();
        r.end = TrimEnd::Back;
    }
    ESYNC_INFOF("Removed %s event in %s stream", to_string(r.end), to_string(r.side));

    if (reference.size() != candidate.size())
        throw DataIntegrityError("sync edge count mismatch after trimming one edge: reference " +
                                 std::to_string(reference.size()) + ", candidate " +
                                 std::to_string(candidate.size()));
    return r;
}

const char* to_string(TrimEnd e) {
    switch (e) {
        case TrimEnd::None: return "no";
        case TrimEnd::Front: return "first";
        case TrimEnd::Back: return "last";
    }
    return "?";
}

const char* to_string(TrimSide s) {
    switch (s) {
        case TrimSide::None: return "neither";
        case TrimSide::Reference: return "main";
        case TrimSide::Candidate: return "current";
    }
    return "?";
}

} // namespace esync::align
