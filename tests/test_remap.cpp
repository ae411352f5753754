#include <gtest/gtest.h>
#include "esync/align/remap.hpp"
#include "esync/errors.hpp"
#include <algorithm>
#include <random>
#include <vector>

using namespace esync;
using namespace esync::align;

TEST(Remap, LinearAnchorsAreExact) {
  std::vector<double> ai = {0.0, 10.0, 20.0};
  std::vector<double> at = {0.0, 1.0, 2.0};
  std::vector<double> raw = {0.0, 5.0, 10.0, 15.0, 20.0};
  auto out = remap(raw, ai, at);
  ASSERT_EQ(out.size(), raw.size());
  for (size_t i = 0; i < raw.size(); ++i) EXPECT_DOUBLE_EQ(out[i], raw[i] / 10.0);
}

TEST(Remap, ExtrapolatesWithEdgeSlopes) {
  std::vector<double> ai = {100.0, 200.0, 300.0};
  std::vector<double> at = {0.0, 1.0, 3.0};
  std::vector<double> raw = {0.0, 150.0, 250.0, 400.0};
  auto out = remap(raw, ai, at);
  EXPECT_DOUBLE_EQ(out[0], -1.0);  // first segment slope 0.01
  EXPECT_DOUBLE_EQ(out[1], 0.5);
  EXPECT_DOUBLE_EQ(out[2], 2.0);
  EXPECT_DOUBLE_EQ(out[3], 5.0);   // last segment slope 0.02
}

TEST(Remap, PreservesLengthAndOrder) {
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> step(0.5, 2.0);
  std::vector<double> ai, at;
  double x = 0.0, y = 0.0;
  for (int k = 0; k < 50; ++k) {
    ai.push_back(x);
    at.push_back(y);
    x += 1000.0 * step(rng);
    y += step(rng);
  }
  std::vector<int64_t> raw;
  for (int64_t s = -5000; s < static_cast<int64_t>(x) + 5000; s += 13) raw.push_back(s);
  auto out = remap(raw, ai, at);
  ASSERT_EQ(out.size(), raw.size());
  EXPECT_TRUE(std::is_sorted(out.begin(), out.end()));
  // anchors map onto themselves
  auto at_anchor = remap(std::span<const double>(ai), ai, at);
  for (size_t k = 0; k < ai.size(); ++k) EXPECT_NEAR(at_anchor[k], at[k], 1e-9);
}

TEST(Remap, UnsortedInput) {
  AnchorSet a;
  a.sample_index = {0.0, 10.0, 20.0};
  a.target_time = {0.0, 2.0, 3.0};
  std::vector<double> raw = {15.0, 5.0, 25.0, -5.0};
  auto out = remap(raw, a);
  EXPECT_DOUBLE_EQ(out[0], 2.5);
  EXPECT_DOUBLE_EQ(out[1], 1.0);
  EXPECT_DOUBLE_EQ(out[2], 3.5);
  EXPECT_DOUBLE_EQ(out[3], -1.0);
}

TEST(Remap, EmptyInput) {
  std::vector<double> ai = {0.0, 1.0};
  std::vector<double> at = {0.0, 1.0};
  EXPECT_TRUE(remap(std::vector<double>{}, ai, at).empty());
}

TEST(Remap, RejectsDegenerateAnchors) {
  std::vector<double> raw = {1.0, 2.0};
  std::vector<double> one = {0.0};
  EXPECT_THROW(remap(raw, one, one), DataIntegrityError);
  std::vector<double> ai = {0.0, 5.0, 5.0};
  std::vector<double> at = {0.0, 1.0, 2.0};
  EXPECT_THROW(remap(raw, ai, at), DataIntegrityError);
  std::vector<double> short_t = {0.0, 1.0};
  EXPECT_THROW(remap(raw, ai, short_t), std::invalid_argument);
}
