#pragma once

#include <envmgr/codecs/codec.h>

namespace envmgr
{

    /// Tabular format: header `scope,name,value`, one row per variable, RFC 4180 quoting.
    ///
    /// The kind comes from the configured PathLike names and the value type is
    /// inferred from the value, so only Set records can be expressed. An expand
    /// value without a `%` reference comes back as a plain string.
    class CsvCodec : public ICodec
    {
    public:
        explicit CsvCodec(std::vector<std::string> path_like_names)
            : m_path_like_names{std::move(path_like_names)}
        {
        }

        Format format() const override { return Format::Csv; }

        using ICodec::encode;
        Bytes encode(std::span<const VariableSet> sets) const override;
        Result<ImportBatch> decode(std::span<const uint8_t> data) const override;

    private:
        const std::vector<std::string> m_path_like_names;
    };

} // namespace envmgr
