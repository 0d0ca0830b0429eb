#pragma once

#include <envmgr/registry/accessor.h>

namespace envmgr
{

    /// RegistryAccessor over the live Windows registry.
    ///
    /// Broadcasts WM_SETTINGCHANGE("Environment") with a 5 second timeout.
    class Win32RegistryAccessor : public RegistryAccessor
    {
    public:
        Win32RegistryAccessor() = default;

        Result<VariableSet> read(Scope scope) const override;
        bool has_write_access(Scope scope) const override;

    private:
        Result<void> do_write(const Variable& variable) override;
        Result<void> do_remove(Scope scope, std::string_view name) override;
        bool do_broadcast() override;
    };

} // namespace envmgr
