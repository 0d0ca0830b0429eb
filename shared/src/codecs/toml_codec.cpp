#include "pch.h"
#include <envmgr/codecs/toml_codec.h>
#include <envmgr/core/segments.h>
#include <toml++/toml.hpp>

namespace envmgr
{

namespace
{

toml::table variable_to_toml(const Variable& variable)
{
    toml::table tbl;
    tbl.insert("name", variable.name);
    tbl.insert("kind", kind_to_string(variable.kind));
    if (variable.type == ValueType::ExpandString)
        tbl.insert("type", "expand");

    if (variable.kind == VariableKind::PathLike)
    {
        toml::array segments;
        for (const auto& segment : split_segments(variable.value))
            segments.push_back(segment);
        tbl.insert("segments", std::move(segments));
    }
    else
    {
        tbl.insert("value", variable.value);
    }
    return tbl;
}

Error malformed(size_t index, std::string message)
{
    return Error{ErrorCode::MalformedInput, std::format("variable #{}: {}", index + 1, message)};
}

Result<ImportRecord> record_from_toml(const toml::table& tbl, size_t index, Scope default_scope)
{
    ImportRecord record;
    record.scope = default_scope;

    auto name = tbl["name"].value<std::string>();
    if (!name)
        return std::unexpected(malformed(index, "missing or non-string 'name'"));
    record.name = *name;

    if (auto scope = tbl["scope"].value<std::string>())
    {
        if (!parse_scope(*scope, record.scope))
            return std::unexpected(malformed(index, std::format("unknown scope '{}'", *scope)));
    }

    const std::string action = tbl["action"].value_or(std::string{"set"});
    if (pnq::string::equals_nocase(action, "delete"))
    {
        record.action = RecordAction::Delete;
        return record;
    }
    if (!pnq::string::equals_nocase(action, "set"))
        return std::unexpected(malformed(index, std::format("unknown action '{}'", action)));

    const toml::array* segments = tbl["segments"].as_array();
    const bool has_value = tbl.contains("value");
    if (segments && has_value)
        return std::unexpected(malformed(index, "both 'value' and 'segments' given"));

    if (auto kind = tbl["kind"].value<std::string>())
    {
        if (!parse_kind(*kind, record.kind))
            return std::unexpected(malformed(index, std::format("unknown kind '{}'", *kind)));
    }
    else
    {
        record.kind = segments ? VariableKind::PathLike : VariableKind::Plain;
    }

    if (segments)
    {
        std::vector<std::string> items;
        for (const auto& elem : *segments)
        {
            const auto* str = elem.as_string();
            if (!str)
                return std::unexpected(malformed(index, "non-string entry in 'segments'"));
            items.push_back(str->get());
        }
        record.value = join_segments(items);
    }
    else if (has_value)
    {
        auto value = tbl["value"].value<std::string>();
        if (!value)
            return std::unexpected(malformed(index, "'value' is not a string"));
        record.value = *value;
    }
    else
    {
        return std::unexpected(malformed(index, "neither 'value' nor 'segments' given"));
    }

    const std::string type = tbl["type"].value_or(std::string{"string"});
    if (pnq::string::equals_nocase(type, "expand"))
        record.type = ValueType::ExpandString;
    else if (!pnq::string::equals_nocase(type, "string"))
        return std::unexpected(malformed(index, std::format("unknown type '{}'", type)));

    return record;
}

toml::table scope_document(const VariableSet& set)
{
    toml::array variables;
    for (const auto& variable : set)
        variables.push_back(variable_to_toml(variable));

    toml::table tbl;
    tbl.insert("variable", std::move(variables));
    return tbl;
}

Result<void> decode_variables(const toml::table& document, Scope default_scope, ImportBatch& batch)
{
    if (!document.contains("variable"))
        return {};

    const toml::array* variables = document["variable"].as_array();
    if (!variables)
        return make_error(ErrorCode::MalformedInput, "'variable' must be an array of tables");

    for (size_t i = 0; i < variables->size(); ++i)
    {
        const toml::table* tbl = (*variables)[i].as_table();
        if (!tbl)
            return std::unexpected(malformed(i, "not a table"));

        auto record = record_from_toml(*tbl, i, default_scope);
        if (!record)
            return std::unexpected(record.error());
        batch.push_back(std::move(*record));
    }
    return {};
}

} // anonymous namespace

Bytes TomlCodec::encode(std::span<const VariableSet> sets) const
{
    toml::table root;
    if (sets.size() == 1)
    {
        root = scope_document(sets.front());
        root.insert("scope", scope_to_string(sets.front().scope()));
    }
    else
    {
        for (const auto& set : sets)
            root.insert(scope_to_string(set.scope()), scope_document(set));
    }

    std::ostringstream oss;
    oss << root << '\n';
    const std::string text = oss.str();
    return Bytes(text.begin(), text.end());
}

Result<ImportBatch> TomlCodec::decode(std::span<const uint8_t> data) const
{
    const std::string text = decode_text(data);

    toml::table root;
    try
    {
        root = toml::parse(text);
    }
    catch (const toml::parse_error& e)
    {
        spdlog::error("Failed to parse TOML import: {}", e.what());
        return make_error(ErrorCode::MalformedInput,
                          std::format("TOML syntax error at line {}: {}", e.source().begin.line, e.description()));
    }

    Scope default_scope = Scope::User;
    if (auto scope = root["scope"].value<std::string>())
    {
        if (!parse_scope(*scope, default_scope))
            return make_error(ErrorCode::MalformedInput, std::format("unknown scope '{}'", *scope));
    }

    ImportBatch batch;
    if (auto ok = decode_variables(root, default_scope, batch); !ok)
        return std::unexpected(ok.error());

    for (const Scope scope : ALL_SCOPES)
    {
        const toml::node* section = root.get(scope_to_string(scope));
        if (!section)
            continue;

        const toml::table* document = section->as_table();
        if (!document)
            return make_error(ErrorCode::MalformedInput, std::format("'{}' must be a table", scope_to_string(scope)));

        if (auto ok = decode_variables(*document, scope, batch); !ok)
            return std::unexpected(ok.error());
    }

    return batch;
}

} // namespace envmgr
