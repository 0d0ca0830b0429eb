#pragma once

// =============================================================================
// envmgr/snapshot/archive_writer.h - Zip writer for snapshot files
// =============================================================================

#include <cstdint>
#include <pnq/pnq.h>
#include <span>
#include <string>
#include <string_view>

namespace envmgr
{

/// Builds one snapshot archive with miniz.
///
/// Entries are added in memory order; the central directory is only written by
/// commit(). Destroying an uncommitted writer leaves a truncated file that the
/// caller is expected to delete.
class SnapshotArchiveWriter final
{
    PNQ_DECLARE_NON_COPYABLE(SnapshotArchiveWriter)

public:
    explicit SnapshotArchiveWriter(std::string path);
    ~SnapshotArchiveWriter();

    /// Create the file on disk. Must succeed before entries can be added.
    bool begin();

    /// Add an entry; '\' in @p name is stored as '/'.
    bool add_entry(std::string_view name, std::span<const uint8_t> data);
    bool add_entry(std::string_view name, std::string_view text);

    /// Write the central directory and close the file.
    bool commit();

    const std::string& path() const { return m_path; }

private:
    void abandon();

    const std::string m_path;
    void* m_archive; ///< mz_zip_archive*
    bool m_writing;
};

} // namespace envmgr
