#include "pch.h"
#include <envmgr/codecs/codec.h>
#include <envmgr/codecs/csv_codec.h>
#include <envmgr/codecs/reg_codec.h>
#include <envmgr/codecs/toml_codec.h>

namespace envmgr
{

const char* format_to_string(Format format)
{
    switch (format)
    {
    case Format::Toml:
        return "toml";
    case Format::Csv:
        return "csv";
    case Format::Reg:
        return "reg";
    }
    return "unknown";
}

bool parse_format(std::string_view str, Format& out_format)
{
    for (const Format format : {Format::Toml, Format::Csv, Format::Reg})
    {
        if (pnq::string::equals_nocase(str, format_to_string(format)))
        {
            out_format = format;
            return true;
        }
    }
    return false;
}

std::optional<Format> format_from_extension(std::string_view path)
{
    const std::string extension = std::filesystem::path{path}.extension().string();
    if (extension.size() < 2)
        return std::nullopt;

    Format format;
    if (parse_format(std::string_view{extension}.substr(1), format))
        return format;
    return std::nullopt;
}

VariableSet to_variable_set(const ImportBatch& batch, Scope scope)
{
    VariableSet set{scope};
    for (const auto& record : batch)
    {
        if (record.scope == scope && record.action == RecordAction::Set)
            set.upsert(record.to_variable());
    }
    return set;
}

std::unique_ptr<ICodec> create_codec(Format format, std::vector<std::string> path_like_names)
{
    switch (format)
    {
    case Format::Toml:
        return std::make_unique<TomlCodec>();
    case Format::Csv:
        return std::make_unique<CsvCodec>(std::move(path_like_names));
    case Format::Reg:
        return std::make_unique<RegCodec>(std::move(path_like_names));
    }
    return nullptr;
}

std::string decode_text(std::span<const uint8_t> data)
{
    // Auto-detect encoding via BOM
    if (data.size() >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF)
        return std::string(reinterpret_cast<const char*>(data.data() + 3), data.size() - 3);

    if (data.size() >= 2 && data[0] == 0xFF && data[1] == 0xFE)
    {
        std::wstring wide((data.size() - 2) / sizeof(wchar_t), L'\0');
        std::memcpy(wide.data(), data.data() + 2, wide.size() * sizeof(wchar_t));
        return pnq::string::encode_as_utf8(wide);
    }

    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

} // namespace envmgr
