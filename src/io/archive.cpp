#include "esync/io/archive.hpp"
#include "esync/errors.hpp"
#include "esync/io/npy.hpp"
#include "esync/log.hpp"

namespace fs = std::filesystem;

namespace esync::io {

ArchiveStatus archive_and_replace(const fs::path& dir,
                                  std::span<const double> values,
                                  const std::string& timestamp_filename,
                                  const std::string& archive_filename) {
    const fs::path current = dir / timestamp_filename;
    const fs::path archive = dir / archive_filename;
    ArchiveStatus status;
    if (!fs::exists(archive)) {
        if (!fs::exists(current)) throw MissingFileError(current);
        fs::rename(current, archive);
        status = ArchiveStatus::Archived;
    } else {
        ESYNC_INFOF("Original timestamps already archived. Removed current timestamps.");
        fs::remove(current);
        status = ArchiveStatus::AlreadyArchived;
    }
    write_npy(current, values);
    ESYNC_DEBUGF("wrote %zu timestamps to %s", values.size(), current.string().c_str());
    return status;
}

} // namespace esync::io
