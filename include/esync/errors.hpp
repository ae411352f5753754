#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace esync {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Counter discontinuities beyond threshold, degenerate anchors, or an
// anchor-count mismatch that survived the single trim.
struct DataIntegrityError : Error {
    using Error::Error;
};

// A barcode segment that does not decode, or a recording with no usable barcodes.
struct BarcodeDecodeError : Error {
    using Error::Error;
};

// More than one digital line passed the barcode line test.
struct AmbiguousSyncLineError : Error {
    AmbiguousSyncLineError(const std::string& what, std::vector<int> candidates)
        : Error(what), candidates(std::move(candidates)) {}
    std::vector<int> candidates;
};

struct MissingFileError : Error {
    explicit MissingFileError(const std::filesystem::path& p)
        : Error("Missing file: " + p.string()), path(p) {}
    MissingFileError(const std::string& what, const std::filesystem::path& p)
        : Error(what), path(p) {}
    std::filesystem::path path;
};

} // namespace esync
