#pragma once

// =============================================================================
// envmgr/core/types.h - Scopes, variables and variable sets
// =============================================================================

#include <string>
#include <string_view>
#include <vector>

namespace envmgr
{

    /// Registry namespace a variable lives in.
    enum class Scope
    {
        User,  ///< HKCU\Environment
        System ///< HKLM\SYSTEM\CurrentControlSet\Control\Session Manager\Environment
    };

    /// How the value of a variable is interpreted.
    enum class VariableKind
    {
        Plain,   ///< Opaque string
        PathLike ///< Ordered list of segments joined by ';'
    };

    /// Registry value type backing a variable.
    enum class ValueType
    {
        String,      ///< REG_SZ
        ExpandString ///< REG_EXPAND_SZ
    };

    /// Both scopes, User first.
    inline constexpr Scope ALL_SCOPES[] = {Scope::User, Scope::System};

    inline const char* scope_to_string(Scope scope)
    {
        return scope == Scope::User ? "user" : "system";
    }

    inline const char* kind_to_string(VariableKind kind)
    {
        return kind == VariableKind::PathLike ? "path" : "plain";
    }

    /// Parse scope from string ("user", "system", "hkcu", "hklm"; case-insensitive).
    /// @return true if valid, false otherwise
    bool parse_scope(std::string_view str, Scope& out_scope);

    /// Parse kind from string ("plain", "path"; case-insensitive).
    bool parse_kind(std::string_view str, VariableKind& out_kind);

    /// Value type a newly created variable gets: ExpandString if it references %VAR%.
    inline ValueType infer_value_type(std::string_view value)
    {
        return value.find('%') != std::string_view::npos ? ValueType::ExpandString : ValueType::String;
    }

    /// A single environment variable.
    struct Variable
    {
        Scope scope = Scope::User;
        std::string name;
        std::string value;
        VariableKind kind = VariableKind::Plain;
        ValueType type = ValueType::String;

        bool operator==(const Variable& other) const = default;
    };

    /// All variables of one scope at one point in time.
    ///
    /// Names are unique under case-insensitive comparison; the original case is
    /// preserved. Entry order is kept as read but is not significant for equality.
    class VariableSet
    {
    public:
        VariableSet() = default;
        explicit VariableSet(Scope scope)
            : m_scope{scope}
        {
        }

        Scope scope() const { return m_scope; }

        /// Find a variable by name (case-insensitive).
        /// @return pointer into the set, or nullptr if absent
        const Variable* find(std::string_view name) const;

        bool contains(std::string_view name) const { return find(name) != nullptr; }

        /// Insert or replace. On replace the existing name casing is kept.
        void upsert(Variable variable);

        /// Remove by name (case-insensitive).
        /// @return true if an entry was removed
        bool erase(std::string_view name);

        const std::vector<Variable>& variables() const { return m_variables; }
        size_t size() const { return m_variables.size(); }
        bool empty() const { return m_variables.empty(); }

        std::vector<Variable>::const_iterator begin() const { return m_variables.begin(); }
        std::vector<Variable>::const_iterator end() const { return m_variables.end(); }

        /// Order-insensitive comparison of scope and entries.
        bool operator==(const VariableSet& other) const;

    private:
        Scope m_scope = Scope::User;
        std::vector<Variable> m_variables;
    };

} // namespace envmgr
