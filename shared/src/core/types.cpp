#include "pch.h"
#include <envmgr/core/types.h>

namespace envmgr
{

bool parse_scope(std::string_view str, Scope& out_scope)
{
    if (pnq::string::equals_nocase(str, "user") || pnq::string::equals_nocase(str, "hkcu"))
    {
        out_scope = Scope::User;
        return true;
    }
    if (pnq::string::equals_nocase(str, "system") || pnq::string::equals_nocase(str, "hklm"))
    {
        out_scope = Scope::System;
        return true;
    }
    return false;
}

bool parse_kind(std::string_view str, VariableKind& out_kind)
{
    if (pnq::string::equals_nocase(str, "plain"))
    {
        out_kind = VariableKind::Plain;
        return true;
    }
    if (pnq::string::equals_nocase(str, "path"))
    {
        out_kind = VariableKind::PathLike;
        return true;
    }
    return false;
}

const Variable* VariableSet::find(std::string_view name) const
{
    for (const auto& variable : m_variables)
    {
        if (pnq::string::equals_nocase(variable.name, name))
            return &variable;
    }
    return nullptr;
}

void VariableSet::upsert(Variable variable)
{
    variable.scope = m_scope;
    for (auto& existing : m_variables)
    {
        if (pnq::string::equals_nocase(existing.name, variable.name))
        {
            variable.name = existing.name;
            existing = std::move(variable);
            return;
        }
    }
    m_variables.push_back(std::move(variable));
}

bool VariableSet::erase(std::string_view name)
{
    auto it = std::find_if(m_variables.begin(), m_variables.end(),
                           [name](const Variable& v) { return pnq::string::equals_nocase(v.name, name); });
    if (it == m_variables.end())
        return false;

    m_variables.erase(it);
    return true;
}

bool VariableSet::operator==(const VariableSet& other) const
{
    if (m_scope != other.m_scope || m_variables.size() != other.m_variables.size())
        return false;

    for (const auto& variable : m_variables)
    {
        const Variable* match = other.find(variable.name);
        if (!match || *match != variable)
            return false;
    }
    return true;
}

} // namespace envmgr
