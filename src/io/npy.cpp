#include "esync/io/npy.hpp"
#include "esync/errors.hpp"
#include <cstring>
#include <fstream>
#include <regex>
#include <stdexcept>

namespace esync::io {

namespace {

constexpr char MAGIC[] = "\x93NUMPY";
constexpr size_t MAGIC_LEN = 6;

std::ifstream open_in(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) throw MissingFileError(path);
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open npy file: " + path.string());
    return f;
}

NpyHeader parse_header(std::istream& in, const std::filesystem::path& path) {
    char magic[MAGIC_LEN];
    unsigned char ver[2];
    if (!in.read(magic, MAGIC_LEN) || std::memcmp(magic, MAGIC, MAGIC_LEN) != 0)
        throw std::runtime_error("Not an npy file: " + path.string());
    if (!in.read(reinterpret_cast<char*>(ver), 2)) throw std::runtime_error("Truncated npy header: " + path.string());
    size_t hlen = 0;
    size_t prefix = MAGIC_LEN + 2;
    if (ver[0] == 1) {
        unsigned char b[2];
        if (!in.read(reinterpret_cast<char*>(b), 2)) throw std::runtime_error("Truncated npy header: " + path.string());
        hlen = size_t(b[0]) | (size_t(b[1]) << 8);
        prefix += 2;
    } else if (ver[0] == 2 || ver[0] == 3) {
        unsigned char b[4];
        if (!in.read(reinterpret_cast<char*>(b), 4)) throw std::runtime_error("Truncated npy header: " + path.string());
        hlen = size_t(b[0]) | (size_t(b[1]) << 8) | (size_t(b[2]) << 16) | (size_t(b[3]) << 24);
        prefix += 4;
    } else {
        throw std::runtime_error("Unsupported npy version " + std::to_string(ver[0]) + ": " + path.string());
    }
    std::string dict(hlen, '\0');
    if (!in.read(dict.data(), static_cast<std::streamsize>(hlen)))
        throw std::runtime_error("Truncated npy header: " + path.string());

    NpyHeader h;
    h.data_offset = prefix + hlen;
    std::smatch m;
    static const std::regex re_descr("'descr'\\s*:\\s*'([^']+)'");
    static const std::regex re_fortran("'fortran_order'\\s*:\\s*(True|False)");
    static const std::regex re_shape("'shape'\\s*:\\s*\\(([^)]*)\\)");
    if (!std::regex_search(dict, m, re_descr)) throw std::runtime_error("npy header without descr: " + path.string());
    h.descr = m[1];
    if (std::regex_search(dict, m, re_fortran)) h.fortran_order = (m[1] == "True");
    if (!std::regex_search(dict, m, re_shape)) throw std::runtime_error("npy header without shape: " + path.string());
    std::string dims = m[1];
    static const std::regex re_num("(\\d+)");
    for (auto it = std::sregex_iterator(dims.begin(), dims.end(), re_num); it != std::sregex_iterator(); ++it)
        h.shape.push_back(static_cast<size_t>(std::stoull((*it)[1])));
    return h;
}

template <typename Src, typename Dst>
void convert_block(std::istream& in, size_t n, std::vector<Dst>& out, const std::filesystem::path& path) {
    std::vector<Src> raw(n);
    if (n && !in.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(n * sizeof(Src))))
        throw std::runtime_error("Truncated npy data: " + path.string());
    out.resize(n);
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<Dst>(raw[i]);
}

template <typename Dst>
std::vector<Dst> read_as(const std::filesystem::path& path) {
    auto f = open_in(path);
    NpyHeader h = parse_header(f, path);
    if (h.shape.size() > 2 || (h.shape.size() == 2 && h.shape[1] != 1))
        throw std::runtime_error("Expected a 1-D npy array: " + path.string());
    const size_t n = h.element_count();
    std::vector<Dst> out;
    const std::string& d = h.descr;
    if (d == "<f8") convert_block<double>(f, n, out, path);
    else if (d == "<f4") convert_block<float>(f, n, out, path);
    else if (d == "<i8") convert_block<int64_t>(f, n, out, path);
    else if (d == "<i4") convert_block<int32_t>(f, n, out, path);
    else if (d == "<i2") convert_block<int16_t>(f, n, out, path);
    else if (d == "|i1") convert_block<int8_t>(f, n, out, path);
    else if (d == "<u8") convert_block<uint64_t>(f, n, out, path);
    else if (d == "<u4") convert_block<uint32_t>(f, n, out, path);
    else if (d == "<u2") convert_block<uint16_t>(f, n, out, path);
    else if (d == "|u1") convert_block<uint8_t>(f, n, out, path);
    else throw std::runtime_error("Unsupported npy dtype " + d + ": " + path.string());
    return out;
}

template <typename T>
void write_as(const std::filesystem::path& path, std::span<const T> values, const char* descr) {
    std::string dict = std::string("{'descr': '") + descr + "', 'fortran_order': False, 'shape': (" +
                       std::to_string(values.size()) + ",), }";
    const size_t unpadded = MAGIC_LEN + 2 + 2 + dict.size() + 1;
    dict.append((64 - unpadded % 64) % 64, ' ');
    dict.push_back('\n');
    if (dict.size() > 0xFFFF) throw std::runtime_error("npy header too long");

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("Failed to create npy file: " + path.string());
    f.write(MAGIC, MAGIC_LEN);
    const unsigned char ver[2] = {1, 0};
    f.write(reinterpret_cast<const char*>(ver), 2);
    const unsigned char len[2] = {static_cast<unsigned char>(dict.size() & 0xFF),
                                  static_cast<unsigned char>((dict.size() >> 8) & 0xFF)};
    f.write(reinterpret_cast<const char*>(len), 2);
    f.write(dict.data(), static_cast<std::streamsize>(dict.size()));
    f.write(reinterpret_cast<const char*>(values.data()), static_cast<std::streamsize>(values.size() * sizeof(T)));
    if (!f) throw std::runtime_error("Failed to write npy file: " + path.string());
}

} // namespace

size_t NpyHeader::element_count() const {
    size_t n = 1;
    for (size_t d : shape) n *= d;
    return n;
}

NpyHeader read_npy_header(const std::filesystem::path& path) {
    auto f = open_in(path);
    return parse_header(f, path);
}

std::vector<double> read_npy_f64(const std::filesystem::path& path) { return read_as<double>(path); }
std::vector<int64_t> read_npy_i64(const std::filesystem::path& path) { return read_as<int64_t>(path); }

void write_npy(const std::filesystem::path& path, std::span<const double> values) {
    write_as<double>(path, values, "<f8");
}

void write_npy(const std::filesystem::path& path, std::span<const int64_t> values) {
    write_as<int64_t>(path, values, "<i8");
}

} // namespace esync::io
