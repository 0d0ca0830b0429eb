#include "pch.h"
#include <envmgr/snapshot/snapshot.h>
#include <pugixml.hpp>
#include <iomanip>

namespace envmgr
{

bool SnapshotInfo::has_scope(Scope scope) const
{
    return std::find(scopes.begin(), scopes.end(), scope) != scopes.end();
}

std::string SnapshotInfo::timestamp_string() const
{
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_s(&tm, &time_t);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d-%H%M%S");
    return oss.str();
}

std::chrono::system_clock::time_point SnapshotInfo::parse_timestamp(std::string_view str)
{
    std::tm tm{};
    std::istringstream iss{std::string{str}};
    iss >> std::get_time(&tm, "%Y%m%d-%H%M%S");

    if (iss.fail())
        return {};

    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::string SnapshotInfo::to_xml() const
{
    pugi::xml_document doc;

    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("snapshot");
    root.append_attribute("id") = id.c_str();
    root.append_attribute("timestamp") = timestamp_string().c_str();

    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
    root.append_attribute("epoch_ms") = static_cast<long long>(epoch_ms);
    root.append_attribute("automatic") = automatic;

    for (const Scope scope : scopes)
    {
        auto scope_node = root.append_child("scope");
        scope_node.append_attribute("name") = scope_to_string(scope);
        scope_node.append_attribute("variables") =
            static_cast<unsigned long long>(scope == Scope::User ? user_variables : system_variables);
    }

    if (!description.empty())
        root.append_child("description").text().set(description.c_str());

    std::ostringstream oss;
    doc.save(oss, "    ");
    return oss.str();
}

std::optional<SnapshotInfo> SnapshotInfo::from_xml(std::string_view xml)
{
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result)
    {
        spdlog::error("Failed to parse snapshot manifest: {}", result.description());
        return std::nullopt;
    }

    auto root = doc.child("snapshot");
    if (!root)
        return std::nullopt;

    SnapshotInfo info;
    info.id = root.attribute("id").as_string();
    if (info.id.empty())
        return std::nullopt;

    // epoch_ms keeps sub-second ordering; the readable timestamp is the fallback
    if (auto epoch = root.attribute("epoch_ms"))
        info.timestamp = std::chrono::system_clock::time_point{std::chrono::milliseconds{epoch.as_llong()}};
    else
        info.timestamp = parse_timestamp(root.attribute("timestamp").as_string());

    info.automatic = root.attribute("automatic").as_bool();

    for (auto scope_node : root.children("scope"))
    {
        Scope scope;
        if (!parse_scope(scope_node.attribute("name").as_string(), scope))
        {
            spdlog::warn("Snapshot {}: ignoring unknown scope '{}'", info.id, scope_node.attribute("name").as_string());
            continue;
        }
        info.scopes.push_back(scope);

        const auto count = static_cast<size_t>(scope_node.attribute("variables").as_ullong());
        if (scope == Scope::User)
            info.user_variables = count;
        else
            info.system_variables = count;
    }

    if (auto desc = root.child("description"))
        info.description = desc.text().as_string();

    return info;
}

const VariableSet* Snapshot::find(Scope scope) const
{
    for (const auto& set : sets)
    {
        if (set.scope() == scope)
            return &set;
    }
    return nullptr;
}

} // namespace envmgr
