#include "pch.h"
#include <envmgr/codecs/reg_codec.h>
#include <envmgr/core/segments.h>
#include <envmgr/registry/accessor.h>

namespace envmgr
{

namespace
{

/// Map "HKCU\Environment" etc. to the full hive form for comparison.
std::string expand_hive(std::string_view key)
{
    const auto slash = key.find('\\');
    const std::string_view hive = key.substr(0, slash);
    const std::string_view rest = (slash == std::string_view::npos) ? std::string_view{} : key.substr(slash);

    if (pnq::string::equals_nocase(hive, "HKCU"))
        return std::string{"HKEY_CURRENT_USER"} + std::string{rest};
    if (pnq::string::equals_nocase(hive, "HKLM"))
        return std::string{"HKEY_LOCAL_MACHINE"} + std::string{rest};
    return std::string{key};
}

std::optional<Scope> scope_of_key(std::string_view path)
{
    const std::string full = expand_hive(path);
    for (const Scope scope : ALL_SCOPES)
    {
        if (pnq::string::equals_nocase(full, registry_key(scope)))
            return scope;
    }
    return std::nullopt;
}

/// Walks an imported key tree and collects the environment values.
class RecordCollector
{
public:
    explicit RecordCollector(const std::vector<std::string>& path_like_names)
        : m_path_like_names{path_like_names}
    {
    }

    Result<void> visit(const pnq::regis3::key_entry* key, const std::string& path)
    {
        const auto scope = path.empty() ? std::nullopt : scope_of_key(path);

        if (!key->values().empty() && !scope)
            return make_error(ErrorCode::MalformedInput, std::format("key '{}' is not an environment key", path));

        if (scope && key->remove_flag())
            return make_error(ErrorCode::MalformedInput, std::format("deleting key '{}' is not supported", path));

        for (const auto& [name, value] : key->values())
        {
            auto result = collect(*scope, value);
            if (!result)
                return result;
        }

        for (const auto& [name, subkey] : key->keys())
        {
            auto result = visit(subkey, path.empty() ? subkey->name() : path + "\\" + subkey->name());
            if (!result)
                return result;
        }
        return {};
    }

    ImportBatch take() { return std::move(m_batch); }

private:
    Result<void> collect(Scope scope, const pnq::regis3::value_entry* value)
    {
        if (value->name().empty())
            return make_error(ErrorCode::MalformedInput, "default value is not an environment variable");

        ImportRecord record;
        record.scope = scope;
        record.name = value->name();
        record.kind = classify(record.name, m_path_like_names);

        if (value->remove_flag())
        {
            record.action = RecordAction::Delete;
        }
        else if (value->kind() == REG_SZ || value->kind() == REG_EXPAND_SZ)
        {
            record.value = value->get_string();
            record.type = (value->kind() == REG_EXPAND_SZ) ? ValueType::ExpandString : ValueType::String;
        }
        else
        {
            return make_error(ErrorCode::MalformedInput, std::format("unsupported value type for '{}'", record.name));
        }

        m_batch.push_back(std::move(record));
        return {};
    }

    const std::vector<std::string>& m_path_like_names;
    ImportBatch m_batch;
};

} // anonymous namespace

Bytes RegCodec::encode(std::span<const VariableSet> sets) const
{
    auto* root = new pnq::regis3::key_entry{nullptr, std::string{}};
    for (const auto& set : sets)
    {
        auto* key = root->find_or_create_key(registry_key(set.scope()));
        for (const auto& variable : set)
        {
            auto* value = key->find_or_create_value(variable.name);
            if (variable.type == ValueType::ExpandString)
                value->set_expanded_string(variable.value);
            else
                value->set_string(variable.value);
        }
    }

    pnq::regis3::regfile_format5_exporter exporter;
    const bool exported = exporter.perform_export(root);
    root->release(REFCOUNT_DEBUG_ARGS);

    if (!exported)
    {
        spdlog::error("Failed to export environment as .reg");
        return {};
    }

    const std::wstring wide = pnq::string::encode_as_utf16(exporter.result());

    Bytes data;
    data.reserve(2 + wide.size() * 2);
    data.push_back(0xFF);
    data.push_back(0xFE);
    for (const wchar_t ch : wide)
    {
        data.push_back(static_cast<uint8_t>(ch & 0xFF));
        data.push_back(static_cast<uint8_t>((ch >> 8) & 0xFF));
    }
    return data;
}

Result<ImportBatch> RegCodec::decode(std::span<const uint8_t> data) const
{
    const std::string text = decode_text(data);

    auto importer = pnq::regis3::create_importer_from_string(text);
    if (!importer)
        return make_error(ErrorCode::MalformedInput, "not a .reg file");

    pnq::regis3::key_entry* root = importer->import();
    if (!root)
        return make_error(ErrorCode::MalformedInput, "cannot parse .reg content");

    RecordCollector collector{m_path_like_names};
    auto visited = collector.visit(root, root->name());
    root->release(REFCOUNT_DEBUG_ARGS);

    if (!visited)
        return std::unexpected(visited.error());
    return collector.take();
}

} // namespace envmgr
