#include "pch.h"
#include <envmgr/registry/accessor.h>

namespace envmgr
{

Result<void> RegistryAccessor::write(const Variable& variable)
{
    auto result = do_write(variable);
    if (result)
        on_changed();
    return result;
}

Result<void> RegistryAccessor::remove(Scope scope, std::string_view name)
{
    auto result = do_remove(scope, name);
    if (result)
        on_changed();
    return result;
}

void RegistryAccessor::broadcast_change()
{
    if (!do_broadcast())
        spdlog::warn("Environment change broadcast did not complete");
}

void RegistryAccessor::on_changed()
{
    if (m_batch_depth > 0)
    {
        m_batch_dirty = true;
        return;
    }
    broadcast_change();
}

ChangeBatch::ChangeBatch(RegistryAccessor& accessor)
    : m_accessor{accessor}
{
    ++m_accessor.m_batch_depth;
}

ChangeBatch::~ChangeBatch()
{
    if (--m_accessor.m_batch_depth == 0 && m_accessor.m_batch_dirty)
    {
        m_accessor.m_batch_dirty = false;
        m_accessor.broadcast_change();
    }
}

} // namespace envmgr
