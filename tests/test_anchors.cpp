#include <gtest/gtest.h>
#include "esync/align/anchors.hpp"
#include "esync/align/reconcile.hpp"
#include "esync/align/remap.hpp"
#include "esync/errors.hpp"
#include <cmath>
#include <vector>

using namespace esync;
using namespace esync::align;

static Event edge(size_t stream, int line, int state, int64_t sample, double t = 0.0) {
  Event e;
  e.stream = stream;
  e.line = line;
  e.state = state;
  e.sample_number = sample;
  e.timestamp = t;
  return e;
}

TEST(Anchors, SelectsLineStateAndSorts) {
  EventStream ev = {
    edge(0, 1, 1, 300), edge(0, 1, 0, 310), edge(0, 2, 1, 50),
    edge(0, 1, 1, 100), edge(1, 1, 1, 7), edge(0, 1, 1, 200),
  };
  auto sel = select_sync_events(ev, 0, 1, false);
  ASSERT_EQ(sel.size(), 3u);
  EXPECT_EQ(sel[0].sample_number, 100);
  EXPECT_EQ(sel[1].sample_number, 200);
  EXPECT_EQ(sel[2].sample_number, 300);

  auto inv = select_sync_events(ev, 0, 1, true);
  ASSERT_EQ(inv.size(), 1u);
  EXPECT_EQ(inv[0].sample_number, 310);

  EXPECT_EQ(events_for_stream(ev, 1).size(), 1u);
}

TEST(Anchors, FirstAnchorAtZero) {
  SyncEdges e;
  e.sample_rate = 30000.0;
  e.sample_numbers = {60000, 90000, 120000};
  auto a = build_anchor_set(e);
  ASSERT_EQ(a.size(), 3u);
  EXPECT_DOUBLE_EQ(a.target_time[0], 0.0);
  EXPECT_DOUBLE_EQ(a.target_time[1], 1.0);
  EXPECT_DOUBLE_EQ(a.target_time[2], 2.0);
  EXPECT_DOUBLE_EQ(a.sample_index[0], 60000.0);

  auto shifted = build_anchor_set(e, 30000);
  EXPECT_DOUBLE_EQ(shifted.target_time[0], 1.0);
}

TEST(Anchors, TooFewEdgesIsFatal) {
  SyncEdges e;
  e.sample_rate = 30000.0;
  e.sample_numbers = {60000};
  EXPECT_THROW(build_anchor_set(e), DataIntegrityError);
  e.sample_numbers = {60000, 90000};
  e.sample_rate = 0.0;
  EXPECT_THROW(build_anchor_set(e), DataIntegrityError);
}

TEST(Anchors, StreamIndexOutOfRange) {
  Recording rec;
  rec.continuous.resize(1);
  EXPECT_THROW(sync_edges_for_stream(rec, 3, 1, false), std::out_of_range);
}

// Two streams at 30000 Hz and 2500 Hz seeing the same 1 Hz sync pulses, with
// the slow stream's clock running 50 ppm fast and an extra leading edge.
TEST(Anchors, EndToEndTwoRates) {
  const double fast = 30000.0, slow = 2500.0;
  const double drift = 1.0 + 50e-6;
  const size_t pulses = 60;
  Recording rec;
  rec.continuous.resize(2);
  rec.continuous[0].name = "ProbeA-AP";
  rec.continuous[0].sample_rate = fast;
  rec.continuous[1].name = "ProbeA-LFP";
  rec.continuous[1].sample_rate = slow;
  // edge k at true time 2 + k seconds
  for (size_t k = 0; k < pulses; ++k) {
    const double t = 2.0 + static_cast<double>(k);
    rec.events.push_back(edge(0, 1, 1, 1000 + std::llround(t * fast), t));
    rec.events.push_back(edge(1, 1, 1, 77 + std::llround(t * slow * drift), t));
  }
  // edge picked up by the slow stream only, 0.6 s before the first shared one
  rec.events.push_back(edge(1, 1, 1, 77 + std::llround(1.4 * slow * drift), 1.4));

  SyncEdges ref = sync_edges_for_stream(rec, 0, 1, false);
  SyncEdges cand = sync_edges_for_stream(rec, 1, 1, false);
  const int64_t origin = ref.sample_numbers.front();
  SyncEdges ref_copy = ref;
  auto r = reconcile_anchor_counts(ref_copy, cand);
  EXPECT_EQ(r.side, TrimSide::Candidate);
  EXPECT_EQ(r.end, TrimEnd::Front);
  ASSERT_EQ(cand.size(), pulses);

  AnchorSet anchors;
  anchors.sample_index.assign(cand.sample_numbers.begin(), cand.sample_numbers.end());
  anchors.target_time = build_anchor_set(ref_copy, origin).target_time;

  // every slow-stream sample between the first and last edge lands on the reference clock
  std::vector<int64_t> samples;
  for (int64_t s = cand.sample_numbers.front(); s <= cand.sample_numbers.back(); s += 97) samples.push_back(s);
  auto t = remap(samples, anchors);
  const double slow_origin = static_cast<double>(cand.sample_numbers.front());
  for (size_t i = 0; i < samples.size(); ++i) {
    const double expected = (static_cast<double>(samples[i]) - slow_origin) / (slow * drift);
    EXPECT_NEAR(t[i], expected, 1.0 / slow) << "sample " << samples[i];
  }
  // the first sync edge maps to exactly the reference's first edge
  EXPECT_DOUBLE_EQ(t[0], 0.0);
}
