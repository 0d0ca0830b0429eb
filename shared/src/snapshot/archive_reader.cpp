#include "pch.h"
#include <envmgr/snapshot/archive_reader.h>
#include <envmgr/codecs/codec.h>

namespace envmgr
{

SnapshotArchiveReader::SnapshotArchiveReader(std::string path)
    : m_path{std::move(path)}
    , m_archive{new mz_zip_archive{}}
    , m_open{false}
{
}

SnapshotArchiveReader::~SnapshotArchiveReader()
{
    auto* zip = static_cast<mz_zip_archive*>(m_archive);
    if (m_open)
        mz_zip_reader_end(zip);
    delete zip;
}

bool SnapshotArchiveReader::open()
{
    if (m_open)
        return true;

    auto* zip = static_cast<mz_zip_archive*>(m_archive);
    *zip = mz_zip_archive{};
    if (!mz_zip_reader_init_file(zip, m_path.c_str(), 0))
    {
        spdlog::warn("Cannot read snapshot archive {}: {}", m_path, mz_zip_get_error_string(mz_zip_get_last_error(zip)));
        return false;
    }

    m_open = true;
    return true;
}

std::optional<std::vector<uint8_t>> SnapshotArchiveReader::entry(std::string_view name) const
{
    if (!m_open)
        return std::nullopt;

    auto* zip = static_cast<mz_zip_archive*>(m_archive);
    const std::string entry_name{name};
    const int index = mz_zip_reader_locate_file(zip, entry_name.c_str(), nullptr, 0);
    if (index < 0)
        return std::nullopt;

    size_t size = 0;
    auto* data = static_cast<uint8_t*>(mz_zip_reader_extract_to_heap(zip, static_cast<mz_uint>(index), &size, 0));
    if (!data)
    {
        spdlog::warn("Damaged entry {} in {}", entry_name, m_path);
        return std::nullopt;
    }

    std::vector<uint8_t> result{data, data + size};
    mz_free(data);
    return result;
}

std::optional<std::string> SnapshotArchiveReader::text_entry(std::string_view name) const
{
    auto data = entry(name);
    if (!data)
        return std::nullopt;
    return decode_text(*data);
}

} // namespace envmgr
