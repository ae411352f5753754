#include <gtest/gtest.h>
#include "esync/errors.hpp"
#include "esync/io/npy.hpp"
#include "synthetic.hpp"
#include <fstream>

using namespace esync;
using namespace esync::io;
using esync::testing::TempDir;

// Raw npy file with a hand-built header, as numpy would write it.
static void write_raw(const std::filesystem::path& p, const std::string& dict, const void* data, size_t bytes) {
  std::string header = dict;
  const size_t unpadded = 10 + header.size() + 1;
  header.append((64 - unpadded % 64) % 64, ' ');
  header.push_back('\n');
  std::ofstream f(p, std::ios::binary);
  f.write("\x93NUMPY\x01\x00", 8);
  const char len[2] = {static_cast<char>(header.size() & 0xFF), static_cast<char>(header.size() >> 8)};
  f.write(len, 2);
  f.write(header.data(), static_cast<std::streamsize>(header.size()));
  f.write(static_cast<const char*>(data), static_cast<std::streamsize>(bytes));
}

TEST(Npy, WritesAlignedFloat64) {
  TempDir dir("npy");
  std::vector<double> v = {0.0, -1.5, 3.25e9, 1e-12};
  const auto p = dir.path() / "timestamps.npy";
  write_npy(p, v);
  auto h = read_npy_header(p);
  EXPECT_EQ(h.descr, "<f8");
  EXPECT_FALSE(h.fortran_order);
  ASSERT_EQ(h.shape.size(), 1u);
  EXPECT_EQ(h.shape[0], v.size());
  EXPECT_EQ(h.data_offset % 64, 0u);
  EXPECT_EQ(std::filesystem::file_size(p), h.data_offset + v.size() * sizeof(double));
  EXPECT_EQ(read_npy_f64(p), v);
}

TEST(Npy, WritesInt64) {
  TempDir dir("npy");
  std::vector<int64_t> v = {-3, 0, 1ll << 40};
  const auto p = dir.path() / "sample_numbers.npy";
  write_npy(p, std::span<const int64_t>(v));
  EXPECT_EQ(read_npy_header(p).descr, "<i8");
  EXPECT_EQ(read_npy_i64(p), v);
  auto as_f = read_npy_f64(p);
  EXPECT_DOUBLE_EQ(as_f[2], 1099511627776.0);
}

TEST(Npy, ReadsNarrowTypesAndColumnVectors) {
  TempDir dir("npy");
  const int16_t states[] = {1, -1, 3, -3};
  write_raw(dir.path() / "states.npy", "{'descr': '<i2', 'fortran_order': False, 'shape': (4,), }", states,
            sizeof(states));
  EXPECT_EQ(read_npy_i64(dir.path() / "states.npy"), (std::vector<int64_t>{1, -1, 3, -3}));

  const float col[] = {0.5f, 1.5f, 2.5f};
  write_raw(dir.path() / "col.npy", "{'descr': '<f4', 'fortran_order': False, 'shape': (3, 1), }", col,
            sizeof(col));
  EXPECT_EQ(read_npy_f64(dir.path() / "col.npy"), (std::vector<double>{0.5, 1.5, 2.5}));
}

TEST(Npy, Errors) {
  TempDir dir("npy");
  EXPECT_THROW(read_npy_f64(dir.path() / "absent.npy"), MissingFileError);

  {
    std::ofstream f(dir.path() / "garbage.npy", std::ios::binary);
    f << "not numpy at all";
  }
  EXPECT_THROW(read_npy_f64(dir.path() / "garbage.npy"), std::runtime_error);

  const double m[] = {1, 2, 3, 4};
  write_raw(dir.path() / "matrix.npy", "{'descr': '<f8', 'fortran_order': False, 'shape': (2, 2), }", m, sizeof(m));
  EXPECT_THROW(read_npy_f64(dir.path() / "matrix.npy"), std::runtime_error);

  write_raw(dir.path() / "short.npy", "{'descr': '<f8', 'fortran_order': False, 'shape': (10,), }", m, sizeof(m));
  EXPECT_THROW(read_npy_f64(dir.path() / "short.npy"), std::runtime_error);

  write_raw(dir.path() / "complex.npy", "{'descr': '<c16', 'fortran_order': False, 'shape': (2,), }", m, sizeof(m));
  EXPECT_THROW(read_npy_f64(dir.path() / "complex.npy"), std::runtime_error);
}
