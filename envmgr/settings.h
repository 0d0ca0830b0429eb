#pragma once

// =============================================================================
// settings.h - Persistent settings for the envmgr command line tool
// =============================================================================

#include <envmgr/core/config.h>
#include <pnq/config/section.h>
#include <pnq/config/typed_value.h>
#include <pnq/config/toml_backend.h>
#include <string>
#include <string_view>

namespace envmgr
{
namespace config
{

/// Root configuration section (%APPDATA%\envmgr\envmgr.toml).
class RootSettings : public pnq::config::Section
{
public:
    RootSettings()
        : Section{}
    {
    }

    struct LoggingSettings : public pnq::config::Section
    {
        LoggingSettings(Section* pParent)
            : Section{pParent, "Logging"}
        {
        }
        pnq::config::TypedValue<std::string> logLevel{this, "LogLevel", "info"};
        pnq::config::TypedValue<std::string> logFilePath{this, "LogFilePath", ""}; // Empty = use default
    } logging{this};

    struct BackupSettings : public pnq::config::Section
    {
        BackupSettings(Section* pParent)
            : Section{pParent, "Backup"}
        {
        }
        pnq::config::TypedValue<std::string> directory{this, "Directory", ""}; // Empty = use default
        pnq::config::TypedValue<bool> autoBackup{this, "AutoBackup", true};
        pnq::config::TypedValue<int32_t> maxCount{this, "MaxCount", 10};
        pnq::config::TypedValue<int32_t> maxAgeDays{this, "MaxAgeDays", 30}; // 0 = no age limit
        pnq::config::TypedValue<int32_t> keepLatest{this, "KeepLatest", 3};
    } backup{this};

    struct HistorySettings : public pnq::config::Section
    {
        HistorySettings(Section* pParent)
            : Section{pParent, "History"}
        {
        }
        pnq::config::TypedValue<int32_t> capacity{this, "Capacity", 100};
    } history{this};

    struct ValidationSettings : public pnq::config::Section
    {
        ValidationSettings(Section* pParent)
            : Section{pParent, "Validation"}
        {
        }
        pnq::config::TypedValue<bool> checkDirectories{this, "CheckDirectories", true};
        pnq::config::TypedValue<std::string> pathLikeNames{this, "PathLikeNames", DEFAULT_PATH_LIKE_NAMES};
    } validation{this};

    /// Load settings from file. Creates the parent directory if needed.
    bool load(std::string_view path);

    /// Save settings to file.
    bool save(std::string_view path) const;

    /// Map the persisted values onto the engine configuration.
    EngineConfig to_engine_config() const;

    /// Get the default config file path (%APPDATA%\envmgr\envmgr.toml)
    static std::string default_config_path();

    /// Local data directory for logs and backups (%LOCALAPPDATA%\envmgr)
    static std::string default_data_path();
};

} // namespace config
} // namespace envmgr
