#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace esync::io {

// NumPy .npy arrays (format 1.0/2.0), 1-D or N x 1, C order.
// Readers accept little-endian <f8 <f4 <i8 <i4 <i2 <u8 <u4 <u2 |i1 |u1 and
// convert to the requested element type. Endianness is assumed little-endian host.
// Throws MissingFileError when the file does not exist and std::runtime_error
// on malformed content.
struct NpyHeader {
    std::string descr;
    bool fortran_order{false};
    std::vector<size_t> shape;
    size_t data_offset{0};

    size_t element_count() const;
};

NpyHeader read_npy_header(const std::filesystem::path& path);

std::vector<double> read_npy_f64(const std::filesystem::path& path);
std::vector<int64_t> read_npy_i64(const std::filesystem::path& path);

// Write a 1-D array ('<f8' / '<i8') with a 64-byte aligned v1.0 header.
void write_npy(const std::filesystem::path& path, std::span<const double> values);
void write_npy(const std::filesystem::path& path, std::span<const int64_t> values);

} // namespace esync::io
