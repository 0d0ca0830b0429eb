#include "pch.h"
#include <envmgr/snapshot/archive_writer.h>

namespace envmgr
{

namespace
{

constexpr mz_uint ENTRY_COMPRESSION = MZ_BEST_SPEED;

mz_zip_archive* as_zip(void* archive)
{
    return static_cast<mz_zip_archive*>(archive);
}

} // anonymous namespace

SnapshotArchiveWriter::SnapshotArchiveWriter(std::string path)
    : m_path{std::move(path)}
    , m_archive{new mz_zip_archive{}}
    , m_writing{false}
{
}

SnapshotArchiveWriter::~SnapshotArchiveWriter()
{
    abandon();
    delete as_zip(m_archive);
}

bool SnapshotArchiveWriter::begin()
{
    abandon();
    *as_zip(m_archive) = mz_zip_archive{};

    if (!mz_zip_writer_init_file(as_zip(m_archive), m_path.c_str(), 0))
    {
        spdlog::error("Cannot create snapshot archive {}: {}", m_path,
                      mz_zip_get_error_string(mz_zip_get_last_error(as_zip(m_archive))));
        return false;
    }

    m_writing = true;
    return true;
}

void SnapshotArchiveWriter::abandon()
{
    if (!m_writing)
        return;

    mz_zip_writer_end(as_zip(m_archive));
    m_writing = false;
}

bool SnapshotArchiveWriter::add_entry(std::string_view name, std::span<const uint8_t> data)
{
    if (!m_writing)
        return false;

    std::string entry_name{name};
    std::replace(entry_name.begin(), entry_name.end(), '\\', '/');

    if (!mz_zip_writer_add_mem(as_zip(m_archive), entry_name.c_str(), data.data(), data.size(), ENTRY_COMPRESSION))
    {
        spdlog::error("Cannot add {} to snapshot archive {}", entry_name, m_path);
        return false;
    }
    return true;
}

bool SnapshotArchiveWriter::add_entry(std::string_view name, std::string_view text)
{
    return add_entry(name, std::span{reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

bool SnapshotArchiveWriter::commit()
{
    if (!m_writing)
        return false;

    const bool finalized = mz_zip_writer_finalize_archive(as_zip(m_archive));
    const bool closed = mz_zip_writer_end(as_zip(m_archive));
    m_writing = false;

    if (!finalized || !closed)
    {
        spdlog::error("Cannot complete snapshot archive {}", m_path);
        return false;
    }
    return true;
}

} // namespace envmgr
