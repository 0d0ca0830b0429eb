#include "pch.h"
#include <envmgr/registry/memory_accessor.h>

namespace envmgr
{

MemoryRegistryAccessor::MemoryRegistryAccessor() = default;

Result<std::unique_ptr<MemoryRegistryAccessor>> MemoryRegistryAccessor::copy_of(const RegistryAccessor& source)
{
    auto copy = std::make_unique<MemoryRegistryAccessor>();
    for (const Scope scope : ALL_SCOPES)
    {
        auto set = source.read(scope);
        if (!set)
            return std::unexpected(set.error());
        copy->seed(std::move(*set));
    }
    copy->set_elevated(source.has_write_access(Scope::System));
    return copy;
}

Result<VariableSet> MemoryRegistryAccessor::read(Scope scope) const
{
    return scope == Scope::User ? m_user : m_system;
}

bool MemoryRegistryAccessor::has_write_access(Scope scope) const
{
    return scope == Scope::User || m_elevated;
}

void MemoryRegistryAccessor::seed(Variable variable)
{
    set_for(variable.scope).upsert(std::move(variable));
}

void MemoryRegistryAccessor::seed(VariableSet set)
{
    set_for(set.scope()) = std::move(set);
}

Result<void> MemoryRegistryAccessor::check_writable(Scope scope, std::string_view name)
{
    if (!has_write_access(scope))
        return make_error(ErrorCode::AccessDenied, "Write access denied", scope, std::string{name});

    if (m_writes_until_failure)
    {
        if (*m_writes_until_failure == 0)
            return make_error(ErrorCode::IoError, "Simulated registry failure", scope, std::string{name});
        --*m_writes_until_failure;
    }
    return {};
}

Result<void> MemoryRegistryAccessor::do_write(const Variable& variable)
{
    if (variable.name.empty())
        return make_error(ErrorCode::InvalidName, "Empty value name", variable.scope, variable.name);

    if (auto ok = check_writable(variable.scope, variable.name); !ok)
        return ok;

    if (m_write_hook)
        m_write_hook(variable);

    set_for(variable.scope).upsert(variable);
    ++m_write_count;
    return {};
}

Result<void> MemoryRegistryAccessor::do_remove(Scope scope, std::string_view name)
{
    if (!set_for(scope).contains(name))
        return make_error(ErrorCode::NotFound, "Variable does not exist", scope, std::string{name});

    if (auto ok = check_writable(scope, name); !ok)
        return ok;

    set_for(scope).erase(name);
    ++m_write_count;
    return {};
}

bool MemoryRegistryAccessor::do_broadcast()
{
    ++m_broadcast_count;
    return true;
}

} // namespace envmgr
