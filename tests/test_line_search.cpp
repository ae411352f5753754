#include <gtest/gtest.h>
#include "esync/errors.hpp"
#include "esync/harp/line_search.hpp"
#include "synthetic.hpp"
#include <cmath>
#include <random>

using namespace esync;
using namespace esync::harp;
using esync::testing::append_edges;
using esync::testing::encode_barcode_train;

namespace {

// Four digital lines on stream 0 over a 700 s session:
//   1: 1 Hz sync square wave
//   2: sparse random pulses
//   3: Harp barcodes, one per second
//   4: barcode-like bursts during the first 200 s only
EventStream four_line_session() {
  EventStream ev;
  const double session = 700.0;
  {
    std::vector<double> t;
    std::vector<int> s;
    for (double x = 0.25; x < session; x += 1.0) {
      t.push_back(x);
      s.push_back(1);
      t.push_back(x + 0.5);
      s.push_back(0);
    }
    append_edges(ev, 0, 1, t, s);
  }
  {
    std::mt19937 rng(42);
    std::exponential_distribution<double> gap(1.0 / 3.0);
    std::vector<double> t;
    std::vector<int> s;
    for (double x = 0.1 + gap(rng); x < session; x += 0.2 + gap(rng)) {
      t.push_back(x);
      s.push_back(1);
      t.push_back(x + 0.1);
      s.push_back(0);
    }
    append_edges(ev, 0, 2, t, s);
  }
  {
    std::vector<double> t;
    std::vector<int> s;
    encode_barcode_train(1000, 699, 0.6, 1000.0, t, s);
    append_edges(ev, 0, 3, t, s);
  }
  {
    std::vector<double> t;
    std::vector<int> s;
    encode_barcode_train(5000, 200, 0.3, 1000.0, t, s);
    // one final pulse stretches the line over the whole session
    t.push_back(session - 0.5);
    s.push_back(1);
    t.push_back(session - 0.4);
    s.push_back(0);
    append_edges(ev, 0, 4, t, s);
  }
  return ev;
}

} // namespace

TEST(LineSearch, ChiSquareSurvival) {
  EXPECT_DOUBLE_EQ(chi2_survival(0.0, 5.0), 1.0);
  EXPECT_DOUBLE_EQ(chi2_survival(3.0, 0.0), 0.0);
  // dof = 2 has the closed form exp(-x/2)
  EXPECT_NEAR(chi2_survival(2.0, 2.0), std::exp(-1.0), 1e-3);
  EXPECT_NEAR(chi2_survival(6.0, 2.0), std::exp(-3.0), 1e-3);
  // tabulated 5% critical value for 5 dof
  EXPECT_NEAR(chi2_survival(11.0705, 5.0), 0.05, 1e-3);
  EXPECT_LT(chi2_survival(100.0, 3.0), 1e-6);
}

TEST(LineSearch, FindsTheBarcodeLine) {
  HarpConfig cfg;
  auto ev = four_line_session();
  auto res = select_barcode_lines(ev, 0, cfg);
  ASSERT_EQ(res.lines.size(), 4u);
  ASSERT_EQ(res.candidates.size(), 1u);
  EXPECT_EQ(res.candidates[0], 3);
  EXPECT_EQ(resolve_barcode_line(res), 3);

  const auto& sync = res.lines[0];
  EXPECT_EQ(sync.line, 1);
  EXPECT_GT(sync.p_value, cfg.min_p_value);  // uniform, but no short gaps
  EXPECT_DOUBLE_EQ(sync.short_gap_fraction, 0.0);
  EXPECT_FALSE(sync.accepted);

  const auto& barcode = res.lines[2];
  EXPECT_TRUE(barcode.accepted);
  EXPECT_GT(barcode.short_gap_fraction, 0.5);
  EXPECT_EQ(barcode.onset_counts.size(), 6u);

  const auto& bursts = res.lines[3];
  EXPECT_GT(bursts.short_gap_fraction, 0.5);  // short gaps, but not uniform in time
  EXPECT_LT(bursts.p_value, cfg.min_p_value);
  EXPECT_FALSE(bursts.accepted);
}

TEST(LineSearch, ShortSessionHasNoCandidates) {
  HarpConfig cfg;
  EventStream ev;
  std::vector<double> t;
  std::vector<int> s;
  encode_barcode_train(1, 150, 0.5, 1000.0, t, s);
  append_edges(ev, 0, 3, t, s);
  auto res = select_barcode_lines(ev, 0, cfg);
  ASSERT_EQ(res.lines.size(), 1u);
  EXPECT_DOUBLE_EQ(res.lines[0].p_value, 0.0);
  EXPECT_TRUE(res.candidates.empty());
  EXPECT_THROW(resolve_barcode_line(res), BarcodeDecodeError);
}

TEST(LineSearch, OtherStreamsIgnored) {
  HarpConfig cfg;
  auto ev = four_line_session();
  for (auto& e : ev) e.stream = 1;
  auto res = select_barcode_lines(ev, 0, cfg);
  EXPECT_TRUE(res.lines.empty());
  EXPECT_TRUE(res.candidates.empty());
}

TEST(LineSearch, AmbiguousLines) {
  LineSearchResult res;
  res.candidates = {3, 5};
  try {
    resolve_barcode_line(res);
    FAIL() << "expected AmbiguousSyncLineError";
  } catch (const AmbiguousSyncLineError& e) {
    EXPECT_EQ(e.candidates, (std::vector<int>{3, 5}));
  }
  EXPECT_EQ(resolve_barcode_line(res, 5), 5);
  // a preferred line outside the candidate set does not resolve the ambiguity
  EXPECT_THROW(resolve_barcode_line(res, 7), AmbiguousSyncLineError);
}

TEST(LineSearch, FindStreamByName) {
  Recording rec;
  rec.continuous.resize(3);
  rec.continuous[0].name = "ProbeA-AP";
  rec.continuous[1].name = "ProbeA-LFP";
  rec.continuous[2].name = "PXIe-6341";
  EXPECT_EQ(find_stream(rec, "PXIe"), std::optional<size_t>(2));
  EXPECT_FALSE(find_stream(rec, "NI-DAQ").has_value());
}
