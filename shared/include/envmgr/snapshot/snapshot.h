#pragma once

// =============================================================================
// envmgr/snapshot/snapshot.h - Point-in-time copy of one or more scopes
// =============================================================================

#include <envmgr/core/types.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace envmgr
{

/// Archive entry names inside a snapshot zip.
inline constexpr const char* MANIFEST_ENTRY = "snapshot.xml";

inline std::string scope_entry(Scope scope)
{
    return std::string{"scopes/"} + scope_to_string(scope) + ".toml";
}

inline std::string registry_entry(Scope scope)
{
    return std::string{"registry/"} + scope_to_string(scope) + ".reg";
}

/// Manifest of a snapshot, as stored in snapshot.xml and listed by BackupManager.
struct SnapshotInfo
{
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::vector<Scope> scopes;
    std::string description;
    bool automatic = false;
    size_t user_variables = 0;
    size_t system_variables = 0;

    /// @name Filled in when listed from disk
    /// @{
    std::string path;
    int64_t file_size = 0;
    /// @}

    bool has_scope(Scope scope) const;

    /// Format timestamp as YYYYMMDD-HHMMSS (local time).
    std::string timestamp_string() const;

    /// Parse timestamp from YYYYMMDD-HHMMSS format.
    static std::chrono::system_clock::time_point parse_timestamp(std::string_view str);

    /// Serialize as snapshot.xml.
    std::string to_xml() const;

    /// Parse snapshot.xml.
    /// @return std::nullopt if the document is not a snapshot manifest
    static std::optional<SnapshotInfo> from_xml(std::string_view xml);
};

/// A loaded snapshot: its manifest plus the captured variables.
struct Snapshot
{
    SnapshotInfo info;
    std::vector<VariableSet> sets;

    /// @return the captured set of @p scope, or nullptr if the scope was not captured
    const VariableSet* find(Scope scope) const;
};

} // namespace envmgr
