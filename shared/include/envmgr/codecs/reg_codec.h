#pragma once

#include <envmgr/codecs/codec.h>

namespace envmgr
{

    /// Registry-native format, written and parsed by pnq::regis3.
    ///
    /// Encoding produces a regedit version 5 file as UTF-16LE with BOM, or no bytes
    /// at all if regis3 fails to export. Decoding accepts what regis3 accepts;
    /// only the two environment keys and REG_SZ / REG_EXPAND_SZ values (or
    /// `"name"=-` deletions) are taken over.
    class RegCodec : public ICodec
    {
    public:
        explicit RegCodec(std::vector<std::string> path_like_names)
            : m_path_like_names{std::move(path_like_names)}
        {
        }

        Format format() const override { return Format::Reg; }

        using ICodec::encode;
        Bytes encode(std::span<const VariableSet> sets) const override;
        Result<ImportBatch> decode(std::span<const uint8_t> data) const override;

    private:
        const std::vector<std::string> m_path_like_names;
    };

} // namespace envmgr
