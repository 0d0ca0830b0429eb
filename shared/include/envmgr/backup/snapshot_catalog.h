#pragma once

// =============================================================================
// envmgr/backup/snapshot_catalog.h - SQLite index of snapshot manifests
// =============================================================================

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pnq::sqlite { class Database; }

namespace envmgr
{

/// Index of snapshot.xml manifests stored next to the archives.
///
/// Rows are keyed by snapshot id and carry the archive's mtime and size; a row
/// whose archive changed on disk is ignored. All methods are no-ops while the
/// database is not open, so a missing catalog only costs speed. Calls are
/// serialized on an internal mutex; const listers of the backup directory share
/// one catalog.
class SnapshotCatalog
{
public:
    static constexpr const char* FILENAME = "catalog.db";

    SnapshotCatalog();
    ~SnapshotCatalog();

    /// Open or create the database file. Does nothing if already open.
    bool open(std::string_view path);
    bool is_open() const;

    /// @return the manifest XML, or std::nullopt if unknown or stale
    std::optional<std::string> lookup(std::string_view id, int64_t mtime, int64_t size);

    void store(std::string_view id, int64_t mtime, int64_t size, std::string_view manifest);
    void forget(std::string_view id);

    /// Drop rows of archives that no longer exist.
    void retain_only(const std::vector<std::string>& ids);

private:
    bool is_ready() const;
    void create_tables();

    mutable std::mutex m_mutex;
    std::unique_ptr<pnq::sqlite::Database> m_db;
};

} // namespace envmgr
