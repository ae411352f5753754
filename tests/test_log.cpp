#include <gtest/gtest.h>
#include "esync/log.hpp"
#include "synthetic.hpp"
#include <fstream>
#include <iterator>
#include <string>

using esync::testing::TempDir;

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

TEST(Log, LongMessagesAreNotTruncated) {
  TempDir dir("log");
  const auto file = dir.path() / "esync.log";
  const std::string path(3000, 'p');
  esync::log::set_file(file);
  ESYNC_WARNF("Missing file: %s/timestamps.npy", path.c_str());
  esync::log::set_file({});

  const std::string text = slurp(file);
  EXPECT_NE(text.find("[WARN] Missing file: " + path + "/timestamps.npy\n"), std::string::npos);
}

TEST(Log, ShortMessagesAndLevels) {
  TempDir dir("log");
  const auto file = dir.path() / "esync.log";
  esync::log::set_file(file);
  ESYNC_INFOF("Processing stream: %s", "ProbeA-AP");
  ESYNC_ERRORF("%d streams failed", 2);
  esync::log::set_file({});

  const std::string text = slurp(file);
  EXPECT_NE(text.find("\nProcessing stream: ProbeA-AP\n"), std::string::npos);
  EXPECT_NE(text.find("[ERROR] 2 streams failed\n"), std::string::npos);
}
