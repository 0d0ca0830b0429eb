#pragma once

// =============================================================================
// envmgr/core/config.h - Engine configuration
// =============================================================================

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace envmgr
{

    /// Maximum length of an environment value in UTF-16 code units.
    inline constexpr size_t MAX_VALUE_LENGTH = 32767;

    /// Separator between segments of a PathLike value.
    inline constexpr char SEGMENT_SEPARATOR = ';';

    /// Names treated as PathLike unless configured otherwise.
    inline constexpr const char* DEFAULT_PATH_LIKE_NAMES = "PATH;PSMODULEPATH;PYTHONPATH;CLASSPATH;INCLUDE;LIB;LIBPATH";

    /// Which snapshots prune() may delete.
    ///
    /// A snapshot is removed if it is beyond max_count (newest first) or older
    /// than max_age; the newest keep_latest snapshots are never removed.
    struct RetentionPolicy
    {
        size_t max_count = 10;                 ///< 0 = unlimited
        std::chrono::hours max_age{24 * 30};   ///< 0 = no age limit
        size_t keep_latest = 3;
    };

    /// Conflict handling for bulk imports.
    enum class ConflictPolicy
    {
        Skip,      ///< Leave existing variables untouched
        Overwrite, ///< Replace existing variables
        Fail       ///< Reject the whole batch if any name exists
    };

    /// Plain settings the engine is constructed with.
    struct EngineConfig
    {
        std::string backup_directory;
        bool auto_backup = true;
        RetentionPolicy retention;
        size_t history_capacity = 100;
        bool check_directories = true;
        std::vector<std::string> path_like_names;

        /// Config with DEFAULT_PATH_LIKE_NAMES.
        static EngineConfig defaults();
    };

} // namespace envmgr
