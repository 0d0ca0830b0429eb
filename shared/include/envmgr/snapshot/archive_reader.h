#pragma once

// =============================================================================
// envmgr/snapshot/archive_reader.h - Zip reader for snapshot files
// =============================================================================

#include <cstdint>
#include <optional>
#include <pnq/pnq.h>
#include <string>
#include <string_view>
#include <vector>

namespace envmgr
{

/// Extracts entries of one snapshot archive with miniz.
class SnapshotArchiveReader final
{
    PNQ_DECLARE_NON_COPYABLE(SnapshotArchiveReader)

public:
    explicit SnapshotArchiveReader(std::string path);
    ~SnapshotArchiveReader();

    /// Read the central directory.
    /// @return false if the file is missing or not a zip archive
    bool open();

    /// @return std::nullopt if the entry is missing or damaged
    std::optional<std::vector<uint8_t>> entry(std::string_view name) const;

    /// Entry decoded as text (UTF-8, or UTF-16LE with BOM).
    std::optional<std::string> text_entry(std::string_view name) const;

private:
    const std::string m_path;
    void* m_archive; ///< mz_zip_archive*
    bool m_open;
};

} // namespace envmgr
