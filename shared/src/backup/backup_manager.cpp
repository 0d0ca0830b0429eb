#include "pch.h"
#include <envmgr/backup/backup_manager.h>
#include <envmgr/codecs/reg_codec.h>
#include <envmgr/codecs/toml_codec.h>
#include <envmgr/core/segments.h>
#include <envmgr/registry/accessor.h>
#include <envmgr/snapshot/archive_reader.h>
#include <envmgr/snapshot/archive_writer.h>

namespace envmgr
{

namespace fs = std::filesystem;

namespace
{

constexpr std::string_view ARCHIVE_EXTENSION = ".zip";

uint32_t fnv1a(uint32_t hash, std::span<const uint8_t> data)
{
    for (const uint8_t byte : data)
    {
        hash ^= byte;
        hash *= 16777619u;
    }
    return hash;
}

bool is_valid_id(std::string_view id)
{
    return !id.empty() && id.find_first_of("/\\:") == std::string_view::npos && id.find("..") == std::string_view::npos;
}

int64_t file_mtime(const fs::directory_entry& entry)
{
    std::error_code ec;
    return std::chrono::duration_cast<std::chrono::seconds>(entry.last_write_time(ec).time_since_epoch()).count();
}

} // anonymous namespace

BackupManager::BackupManager(const RegistryAccessor& accessor, std::string directory, std::vector<std::string> path_like_names)
    : m_accessor{accessor}
    , m_directory{std::move(directory)}
    , m_path_like_names{std::move(path_like_names)}
    , m_clock{[] { return std::chrono::system_clock::now(); }}
{
}

BackupManager::~BackupManager() = default;

std::string BackupManager::archive_path(std::string_view id) const
{
    return (fs::path{m_directory} / (std::string{id} + std::string{ARCHIVE_EXTENSION})).string();
}

bool BackupManager::ensure_directory() const
{
    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec)
    {
        spdlog::error("Cannot create backup directory {}: {}", m_directory, ec.message());
        return false;
    }
    return true;
}

void BackupManager::ensure_catalog() const
{
    std::error_code ec;
    if (!m_catalog.is_open() && fs::is_directory(m_directory, ec))
        m_catalog.open((fs::path{m_directory} / SnapshotCatalog::FILENAME).string());
}

Result<SnapshotInfo> BackupManager::snapshot(const std::vector<Scope>& scopes, std::string description, bool automatic)
{
    SnapshotInfo info;
    info.timestamp = m_clock();
    info.description = std::move(description);
    info.automatic = automatic;

    std::vector<VariableSet> sets;
    for (const Scope scope : ALL_SCOPES)
    {
        if (std::find(scopes.begin(), scopes.end(), scope) == scopes.end())
            continue;

        auto current = m_accessor.read(scope);
        if (!current)
        {
            Error error{ErrorCode::BackupFailed, std::format("cannot read {} scope: {}", scope_to_string(scope), current.error().message)};
            error.scope = scope;
            return std::unexpected(std::move(error));
        }

        VariableSet set{scope};
        for (Variable variable : *current)
        {
            variable.kind = classify(variable.name, m_path_like_names);
            set.upsert(std::move(variable));
        }

        info.scopes.push_back(scope);
        (scope == Scope::User ? info.user_variables : info.system_variables) = set.size();
        sets.push_back(std::move(set));
    }

    if (sets.empty())
        return make_error(ErrorCode::BackupFailed, "no scope selected");

    const TomlCodec toml;
    const RegCodec reg{m_path_like_names};

    std::vector<Bytes> toml_data;
    uint32_t hash = 2166136261u;
    for (const auto& set : sets)
    {
        toml_data.push_back(toml.encode(set));
        hash = fnv1a(hash, toml_data.back());
    }
    hash = fnv1a(hash, std::span{reinterpret_cast<const uint8_t*>(info.description.data()), info.description.size()});

    if (!ensure_directory())
        return make_error(ErrorCode::BackupFailed, std::format("cannot create backup directory {}", m_directory));

    // Never overwrite: a colliding id gets a numeric suffix
    const std::string base_id = std::format("{}-{:08x}", info.timestamp_string(), hash);
    info.id = base_id;
    std::error_code ec;
    for (int suffix = 2; fs::exists(archive_path(info.id), ec); ++suffix)
        info.id = std::format("{}-{}", base_id, suffix);

    const std::string final_path = archive_path(info.id);
    const std::string temp_path = final_path + ".tmp";

    bool ok = false;
    {
        SnapshotArchiveWriter writer{temp_path};
        ok = writer.begin() && writer.add_entry(MANIFEST_ENTRY, std::string_view{info.to_xml()});
        for (size_t i = 0; ok && i < sets.size(); ++i)
        {
            ok = writer.add_entry(scope_entry(sets[i].scope()), std::span<const uint8_t>{toml_data[i]}) &&
                 writer.add_entry(registry_entry(sets[i].scope()), std::span<const uint8_t>{reg.encode(sets[i])});
        }
        ok = ok && writer.commit();
    }

    if (ok)
    {
        fs::rename(temp_path, final_path, ec);
        if (ec)
        {
            spdlog::error("Cannot move snapshot into place {}: {}", final_path, ec.message());
            ok = false;
        }
    }

    if (!ok)
    {
        fs::remove(temp_path, ec);
        return make_error(ErrorCode::BackupFailed, std::format("cannot write snapshot {}", final_path));
    }

    info.path = final_path;
    info.file_size = static_cast<int64_t>(fs::file_size(final_path, ec));

    ensure_catalog();
    const fs::directory_entry entry{final_path, ec};
    m_catalog.store(info.id, file_mtime(entry), info.file_size, info.to_xml());

    spdlog::info("Created {} snapshot {} ({} user, {} system variables)",
                 automatic ? "automatic" : "manual", info.id, info.user_variables, info.system_variables);
    return info;
}

Result<Snapshot> BackupManager::load(std::string_view id) const
{
    if (!is_valid_id(id))
        return make_error(ErrorCode::SnapshotNotFound, std::format("invalid snapshot id '{}'", id));

    const std::string path = archive_path(id);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return make_error(ErrorCode::SnapshotNotFound, std::format("snapshot '{}' does not exist", id));

    SnapshotArchiveReader reader{path};
    if (!reader.open())
        return make_error(ErrorCode::IoError, std::format("cannot open snapshot archive {}", path));

    auto manifest = reader.text_entry(MANIFEST_ENTRY);
    if (!manifest)
        return make_error(ErrorCode::MalformedInput, std::format("snapshot {} has no manifest", id));

    auto info = SnapshotInfo::from_xml(*manifest);
    if (!info)
        return make_error(ErrorCode::MalformedInput, std::format("snapshot {} has an invalid manifest", id));

    info->path = path;
    info->file_size = static_cast<int64_t>(fs::file_size(path, ec));

    Snapshot snapshot;
    const TomlCodec toml;
    for (const Scope scope : info->scopes)
    {
        auto data = reader.entry(scope_entry(scope));
        if (!data)
            return make_error(ErrorCode::MalformedInput, std::format("snapshot {} is missing {}", id, scope_entry(scope)));

        auto batch = toml.decode(*data);
        if (!batch)
            return make_error(ErrorCode::MalformedInput, std::format("snapshot {}: {}", id, batch.error().message));

        snapshot.sets.push_back(to_variable_set(*batch, scope));
    }

    snapshot.info = std::move(*info);
    return snapshot;
}

std::optional<SnapshotInfo> BackupManager::read_manifest(const fs::directory_entry& entry) const
{
    std::error_code ec;
    const std::string path = entry.path().string();
    const std::string id = entry.path().stem().string();
    const int64_t mtime = file_mtime(entry);
    const int64_t size = static_cast<int64_t>(entry.file_size(ec));

    std::optional<SnapshotInfo> info;
    if (auto cached = m_catalog.lookup(id, mtime, size))
        info = SnapshotInfo::from_xml(*cached);

    if (!info)
    {
        SnapshotArchiveReader reader{path};
        if (!reader.open())
            return std::nullopt;

        auto manifest = reader.text_entry(MANIFEST_ENTRY);
        if (!manifest)
        {
            spdlog::warn("Skipping {}: no manifest", path);
            return std::nullopt;
        }

        info = SnapshotInfo::from_xml(*manifest);
        if (!info)
            return std::nullopt;

        m_catalog.store(id, mtime, size, *manifest);
    }

    // The archive name is what load() and remove() resolve
    info->id = id;
    info->path = path;
    info->file_size = size;
    return info;
}

Result<std::vector<SnapshotInfo>> BackupManager::list() const
{
    std::vector<SnapshotInfo> result;

    std::error_code ec;
    if (!fs::is_directory(m_directory, ec))
        return result;

    ensure_catalog();

    for (const auto& entry : fs::directory_iterator(m_directory, ec))
    {
        if (!entry.is_regular_file())
            continue;

        if (!pnq::string::equals_nocase(entry.path().extension().string(), ARCHIVE_EXTENSION))
            continue;

        if (auto info = read_manifest(entry))
            result.push_back(std::move(*info));
    }

    if (ec)
        return make_error(ErrorCode::IoError, std::format("cannot list {}: {}", m_directory, ec.message()));

    std::vector<std::string> ids;
    for (const auto& info : result)
        ids.push_back(info.id);
    m_catalog.retain_only(ids);

    std::sort(result.begin(), result.end(), [](const SnapshotInfo& a, const SnapshotInfo& b)
    {
        if (a.timestamp != b.timestamp)
            return a.timestamp > b.timestamp;
        return a.id > b.id;
    });
    return result;
}

Result<void> BackupManager::remove(std::string_view id)
{
    if (!is_valid_id(id))
        return make_error(ErrorCode::SnapshotNotFound, std::format("invalid snapshot id '{}'", id));

    const std::string path = archive_path(id);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return make_error(ErrorCode::SnapshotNotFound, std::format("snapshot '{}' does not exist", id));

    if (!fs::remove(path, ec) || ec)
        return make_error(ErrorCode::IoError, std::format("cannot delete {}: {}", path, ec.message()));

    ensure_catalog();
    m_catalog.forget(id);
    spdlog::info("Deleted snapshot {}", id);
    return {};
}

Result<std::vector<std::string>> BackupManager::prune(const RetentionPolicy& policy)
{
    auto snapshots = list();
    if (!snapshots)
        return std::unexpected(snapshots.error());

    const auto now = m_clock();
    std::vector<std::string> removed;

    for (size_t i = policy.keep_latest; i < snapshots->size(); ++i)
    {
        const auto& info = (*snapshots)[i];
        const bool over_count = policy.max_count > 0 && i >= policy.max_count;
        const bool too_old = policy.max_age.count() > 0 && now - info.timestamp > policy.max_age;
        if (!over_count && !too_old)
            continue;

        if (auto ok = remove(info.id); !ok)
        {
            Error error = ok.error();
            error.names = removed;
            return std::unexpected(std::move(error));
        }
        removed.push_back(info.id);
    }

    if (!removed.empty())
        spdlog::info("Pruned {} snapshot(s)", removed.size());
    return removed;
}

} // namespace envmgr
