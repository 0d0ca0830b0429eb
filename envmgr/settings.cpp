#include "pch.h"
#include "settings.h"
#include <envmgr/core/segments.h>
#include <pnq/path.h>
#include <filesystem>

namespace envmgr
{
namespace config
{

    namespace fs = std::filesystem;

    namespace
    {
        void create_parent_directory(std::string_view path)
        {
            fs::path config_path{path};
            if (config_path.has_parent_path())
            {
                std::error_code ec;
                fs::create_directories(config_path.parent_path(), ec);
                if (ec)
                    spdlog::warn("Cannot create {}: {}", config_path.parent_path().string(), ec.message());
            }
        }

        size_t non_negative(int32_t value)
        {
            return value < 0 ? 0 : static_cast<size_t>(value);
        }
    }

    bool RootSettings::load(std::string_view path)
    {
        create_parent_directory(path);
        pnq::config::TomlBackend backend{std::string{path}};
        return Section::load(backend);
    }

    bool RootSettings::save(std::string_view path) const
    {
        create_parent_directory(path);
        pnq::config::TomlBackend backend{std::string{path}};
        return Section::save(backend);
    }

    EngineConfig RootSettings::to_engine_config() const
    {
        EngineConfig result;

        result.backup_directory = backup.directory.get();
        if (result.backup_directory.empty())
            result.backup_directory = (fs::path{default_data_path()} / "backups").string();

        result.auto_backup = backup.autoBackup.get();
        result.retention.max_count = non_negative(backup.maxCount.get());
        result.retention.max_age = std::chrono::hours{24 * static_cast<int64_t>(non_negative(backup.maxAgeDays.get()))};
        result.retention.keep_latest = non_negative(backup.keepLatest.get());
        result.history_capacity = non_negative(history.capacity.get());
        result.check_directories = validation.checkDirectories.get();
        result.path_like_names = parse_name_list(validation.pathLikeNames.get());
        return result;
    }

    std::string RootSettings::default_config_path()
    {
        auto appdata = pnq::path::get_roaming_app_data("envmgr");
        return (appdata / "envmgr.toml").string();
    }

    std::string RootSettings::default_data_path()
    {
        return (pnq::path::get_known_folder(FOLDERID_LocalAppData) / "envmgr").string();
    }

} // namespace config
} // namespace envmgr
