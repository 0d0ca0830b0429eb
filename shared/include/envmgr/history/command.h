#pragma once

// =============================================================================
// envmgr/history/command.h - Reversible mutations
// =============================================================================

#include <envmgr/core/types.h>
#include <chrono>
#include <optional>
#include <pnq/pnq.h>
#include <pnq/ref_counted.h>
#include <string>
#include <string_view>
#include <vector>

namespace envmgr
{

    enum class CommandKind
    {
        Add,
        Update,
        Delete,
        ReorderSegment,
        SegmentEdit,
        BulkImport,
        Restore
    };

    const char* command_kind_to_string(CommandKind kind);

    /// State of one variable before and after a command. An empty optional means "absent".
    struct Change
    {
        Scope scope = Scope::User;
        std::string name;
        std::optional<Variable> before;
        std::optional<Variable> after;
    };

    /// One atomic, reversible mutation (ref-counted).
    ///
    /// A command is pure data: forward() lists the target states to apply,
    /// inverse() the states that undo them, in reverse order. Applying is done
    /// by the controller so that undo and redo go through the same write path
    /// as the original operation.
    class Command final : public pnq::RefCountImpl
    {
        PNQ_DECLARE_NON_COPYABLE(Command)

    public:
        Command(CommandKind kind, std::string description, std::vector<Change> changes);

        CommandKind kind() const { return m_kind; }
        const std::string& description() const { return m_description; }
        std::chrono::system_clock::time_point created() const { return m_created; }
        const std::vector<Change>& changes() const { return m_changes; }

        /// Changes to apply for redo (same as the original operation).
        std::vector<Change> forward() const { return m_changes; }

        /// Changes to apply for undo.
        std::vector<Change> inverse() const;

        /// Affected scopes, each listed once.
        std::vector<Scope> scopes() const;

        /// Affected variable names in change order.
        std::vector<std::string> names() const;

    private:
        const CommandKind m_kind;
        const std::string m_description;
        const std::vector<Change> m_changes;
        const std::chrono::system_clock::time_point m_created;
    };

} // namespace envmgr
