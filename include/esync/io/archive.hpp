#pragma once
#include <filesystem>
#include <span>
#include <string>

namespace esync::io {

enum class ArchiveStatus {
    Archived,         // the current file was moved to the archive name
    AlreadyArchived,  // an archive existed; the current file was replaced without archiving
};

// Replace dir/timestamp_filename with 'values', keeping the first
// pre-alignment copy as dir/archive_filename. An existing archive is never
// overwritten. Throws MissingFileError when neither file exists.
ArchiveStatus archive_and_replace(const std::filesystem::path& dir,
                                  std::span<const double> values,
                                  const std::string& timestamp_filename = "timestamps.npy",
                                  const std::string& archive_filename = "original_timestamps.npy");

} // namespace esync::io
