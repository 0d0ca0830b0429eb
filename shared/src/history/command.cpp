#include "pch.h"
#include <envmgr/history/command.h>

namespace envmgr
{

    const char* command_kind_to_string(CommandKind kind)
    {
        switch (kind)
        {
        case CommandKind::Add:
            return "add";
        case CommandKind::Update:
            return "update";
        case CommandKind::Delete:
            return "delete";
        case CommandKind::ReorderSegment:
            return "reorder-segment";
        case CommandKind::SegmentEdit:
            return "segment-edit";
        case CommandKind::BulkImport:
            return "bulk-import";
        case CommandKind::Restore:
            return "restore";
        }
        return "unknown";
    }

    Command::Command(CommandKind kind, std::string description, std::vector<Change> changes)
        : m_kind{kind}
        , m_description{std::move(description)}
        , m_changes{std::move(changes)}
        , m_created{std::chrono::system_clock::now()}
    {
    }

    std::vector<Change> Command::inverse() const
    {
        std::vector<Change> result;
        result.reserve(m_changes.size());
        for (auto it = m_changes.rbegin(); it != m_changes.rend(); ++it)
            result.push_back(Change{it->scope, it->name, it->after, it->before});
        return result;
    }

    std::vector<Scope> Command::scopes() const
    {
        std::vector<Scope> result;
        for (const auto& change : m_changes)
        {
            if (std::find(result.begin(), result.end(), change.scope) == result.end())
                result.push_back(change.scope);
        }
        return result;
    }

    std::vector<std::string> Command::names() const
    {
        std::vector<std::string> result;
        result.reserve(m_changes.size());
        for (const auto& change : m_changes)
            result.push_back(change.name);
        return result;
    }

} // namespace envmgr
