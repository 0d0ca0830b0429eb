#pragma once

// =============================================================================
// envmgr/codecs/codec.h - Import/export formats
// =============================================================================

#include <envmgr/core/error.h>
#include <envmgr/core/types.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace envmgr
{

    using Bytes = std::vector<uint8_t>;

    enum class Format
    {
        Toml, ///< Structured, default for export
        Csv,  ///< Tabular
        Reg   ///< regedit version 5 export
    };

    const char* format_to_string(Format format);

    /// Parse format name ("toml", "csv", "reg"; case-insensitive).
    bool parse_format(std::string_view str, Format& out_format);

    /// Guess format from a file extension (.toml, .csv, .reg).
    std::optional<Format> format_from_extension(std::string_view path);

    enum class RecordAction
    {
        Set,
        Delete
    };

    /// One parsed, not yet applied import entry.
    struct ImportRecord
    {
        Scope scope = Scope::User;
        std::string name;
        std::string value;
        VariableKind kind = VariableKind::Plain;
        ValueType type = ValueType::String;
        RecordAction action = RecordAction::Set;

        Variable to_variable() const { return Variable{scope, name, value, kind, type}; }

        bool operator==(const ImportRecord& other) const = default;
    };

    using ImportBatch = std::vector<ImportRecord>;

    /// Collect the Set records of @p scope into a VariableSet.
    VariableSet to_variable_set(const ImportBatch& batch, Scope scope);

    /// Serializer for one file format. Decoding never applies anything.
    class ICodec
    {
    public:
        virtual ~ICodec() = default;

        virtual Format format() const = 0;

        /// Encode one or more scopes into a single document.
        virtual Bytes encode(std::span<const VariableSet> sets) const = 0;

        /// Parse a document.
        /// @return MalformedInput on syntax or structure errors
        virtual Result<ImportBatch> decode(std::span<const uint8_t> data) const = 0;

        Bytes encode(const VariableSet& set) const
        {
            return encode(std::span<const VariableSet>{&set, 1});
        }
    };

    /// Create a codec. @p path_like_names is used by formats that do not record the kind.
    std::unique_ptr<ICodec> create_codec(Format format, std::vector<std::string> path_like_names);

    /// Decode bytes as UTF-8 text, or as UTF-16LE if they start with a BOM. Strips a UTF-8 BOM.
    std::string decode_text(std::span<const uint8_t> data);

} // namespace envmgr
