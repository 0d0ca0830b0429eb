#pragma once

#include <envmgr/codecs/codec.h>

namespace envmgr
{

    /// Structured format.
    ///
    /// @code
    /// scope = "user"
    ///
    /// [[variable]]
    /// name = "PATH"
    /// kind = "path"
    /// segments = ["C:\\Tools", "%USERPROFILE%\\bin"]
    /// type = "expand"
    ///
    /// [[variable]]
    /// name = "OBSOLETE"
    /// action = "delete"
    /// @endcode
    ///
    /// Exporting both scopes nests one such document per scope under `[user]` and
    /// `[system]` (`[[user.variable]]`, ...). A variable may also name its own `scope`.
    /// Missing scope means user; missing kind is derived from the presence of `segments`.
    class TomlCodec : public ICodec
    {
    public:
        Format format() const override { return Format::Toml; }

        using ICodec::encode;
        Bytes encode(std::span<const VariableSet> sets) const override;
        Result<ImportBatch> decode(std::span<const uint8_t> data) const override;
    };

} // namespace envmgr
