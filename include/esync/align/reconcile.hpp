#pragma once
#include <cstddef>
#include "esync/align/anchors.hpp"

namespace esync::align {

enum class TrimEnd { None, Front, Back };
enum class TrimSide { None, Reference, Candidate };

struct Reconciliation {
    TrimEnd end{TrimEnd::None};
    TrimSide side{TrimSide::None};
    double first_edge_offset_s{0.0};
    size_t reference_count{0};  // before trimming
    size_t candidate_count{0};  // before trimming
};

// Make the reference and candidate edge lists the same length by dropping at
// most one edge from the longer list. A first-edge offset above
// 'offset_threshold_s' means the extra edge is at the start; otherwise it is
// at the end. Throws DataIntegrityError if the counts still differ (two or
// more mismatched edges) or either list is empty.
Reconciliation reconcile_anchor_counts(SyncEdges& reference, SyncEdges& candidate,
                                       double offset_threshold_s = 0.1);

const char* to_string(TrimEnd e);
const char* to_string(TrimSide s);

} // namespace esync::align
