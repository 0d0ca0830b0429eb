#pragma once

// =============================================================================
// envmgr/backup/backup_manager.h - Durable, immutable snapshots of both scopes
// =============================================================================

#include <envmgr/backup/snapshot_catalog.h>
#include <envmgr/core/config.h>
#include <envmgr/core/error.h>
#include <envmgr/snapshot/snapshot.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <pnq/pnq.h>
#include <string>
#include <vector>

namespace envmgr
{

class RegistryAccessor;

/// Creates, lists, loads and prunes snapshot archives in one directory.
///
/// Each snapshot is a zip named <id>.zip holding snapshot.xml, scopes/<scope>.toml
/// (authoritative data) and registry/<scope>.reg (for regedit). Archives are written
/// to a temporary name and renamed into place; an existing archive is never replaced.
class BackupManager
{
    PNQ_DECLARE_NON_COPYABLE(BackupManager)

public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// @param accessor Source of the captured variables
    /// @param directory Snapshot directory (created on first snapshot)
    /// @param path_like_names Names stored as segment lists
    BackupManager(const RegistryAccessor& accessor, std::string directory, std::vector<std::string> path_like_names);
    ~BackupManager();

    /// Replace the time source (tests).
    void set_clock(Clock clock) { m_clock = std::move(clock); }

    const std::string& directory() const { return m_directory; }

    /// Capture the current state of @p scopes without modifying it.
    /// @return BackupFailed if the state cannot be read or the archive cannot be written
    Result<SnapshotInfo> snapshot(const std::vector<Scope>& scopes, std::string description, bool automatic);

    /// Load a snapshot by id.
    /// @return SnapshotNotFound, or IoError/MalformedInput for damaged archives
    Result<Snapshot> load(std::string_view id) const;

    /// All readable snapshots, newest first. Damaged archives are logged and skipped.
    Result<std::vector<SnapshotInfo>> list() const;

    /// Delete a snapshot.
    /// @return SnapshotNotFound if no such snapshot exists
    Result<void> remove(std::string_view id);

    /// Delete snapshots outside @p policy.
    /// @return ids of removed snapshots
    Result<std::vector<std::string>> prune(const RetentionPolicy& policy);

private:
    std::string archive_path(std::string_view id) const;
    bool ensure_directory() const;
    void ensure_catalog() const;
    std::optional<SnapshotInfo> read_manifest(const std::filesystem::directory_entry& entry) const;

    const RegistryAccessor& m_accessor;
    const std::string m_directory;
    const std::vector<std::string> m_path_like_names;
    Clock m_clock;
    mutable SnapshotCatalog m_catalog;
};

} // namespace envmgr
