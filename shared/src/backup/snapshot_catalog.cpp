#include "pch.h"
#include <envmgr/backup/snapshot_catalog.h>

namespace envmgr
{

SnapshotCatalog::SnapshotCatalog() = default;

SnapshotCatalog::~SnapshotCatalog()
{
    if (m_db)
        m_db->close();
}

bool SnapshotCatalog::open(std::string_view path)
{
    std::lock_guard lock{m_mutex};
    if (is_ready())
        return true;

    auto db = std::make_unique<pnq::sqlite::Database>();
    if (!db->open(path))
    {
        spdlog::warn("Snapshot catalog unavailable at {}, listing reads archives directly", path);
        return false;
    }

    m_db = std::move(db);
    create_tables();
    return true;
}

bool SnapshotCatalog::is_open() const
{
    std::lock_guard lock{m_mutex};
    return is_ready();
}

bool SnapshotCatalog::is_ready() const
{
    return m_db && m_db->is_valid();
}

std::optional<std::string> SnapshotCatalog::lookup(std::string_view id, int64_t mtime, int64_t size)
{
    std::lock_guard lock{m_mutex};
    if (!is_ready())
        return std::nullopt;

    pnq::sqlite::Statement stmt(*m_db, "SELECT mtime, size, manifest FROM manifests WHERE id = ?");
    stmt.bind(id);
    if (!stmt.execute() || stmt.is_empty())
        return std::nullopt;

    if (stmt.get_int64(0) != mtime || stmt.get_int64(1) != size)
    {
        spdlog::debug("Catalog row for {} is stale", id);
        return std::nullopt;
    }
    return stmt.get_text(2);
}

void SnapshotCatalog::store(std::string_view id, int64_t mtime, int64_t size, std::string_view manifest)
{
    std::lock_guard lock{m_mutex};
    if (!is_ready())
        return;

    pnq::sqlite::Statement stmt(*m_db, "INSERT OR REPLACE INTO manifests (id, mtime, size, manifest) VALUES (?, ?, ?, ?)");
    stmt.bind(id);
    stmt.bind(mtime);
    stmt.bind(size);
    stmt.bind(manifest);
    if (!stmt.execute())
        spdlog::warn("Cannot index snapshot {}", id);
}

void SnapshotCatalog::forget(std::string_view id)
{
    std::lock_guard lock{m_mutex};
    if (!is_ready())
        return;

    pnq::sqlite::Statement stmt(*m_db, "DELETE FROM manifests WHERE id = ?");
    stmt.bind(id);
    if (!stmt.execute())
        spdlog::warn("Cannot drop catalog row for {}", id);
}

void SnapshotCatalog::retain_only(const std::vector<std::string>& ids)
{
    std::lock_guard lock{m_mutex};
    if (!is_ready())
        return;

    if (ids.empty())
    {
        m_db->execute("DELETE FROM manifests");
        return;
    }

    std::string placeholders;
    for (size_t i = 0; i < ids.size(); ++i)
        placeholders += i ? ", ?" : "?";

    const std::string sql = std::format("DELETE FROM manifests WHERE id NOT IN ({})", placeholders);
    pnq::sqlite::Statement stmt(*m_db, sql.c_str());
    for (const auto& id : ids)
        stmt.bind(id);
    if (!stmt.execute())
        spdlog::warn("Cannot clean up snapshot catalog");
}

void SnapshotCatalog::create_tables()
{
    if (m_db->table_exists("manifests"))
        return;

    m_db->execute(R"(
        CREATE TABLE manifests (
            id TEXT PRIMARY KEY,
            mtime INTEGER NOT NULL,
            size INTEGER NOT NULL,
            manifest TEXT NOT NULL
        )
    )");
    spdlog::debug("Created snapshot catalog tables");
}

} // namespace envmgr
