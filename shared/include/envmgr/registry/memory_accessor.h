#pragma once

#include <envmgr/registry/accessor.h>
#include <functional>
#include <memory>
#include <optional>

namespace envmgr
{

    /// RegistryAccessor backed by two in-memory VariableSets.
    ///
    /// Used by tests and by simulate mode. Writes to System scope require
    /// set_elevated(true); a write budget can be set to make later writes fail.
    class MemoryRegistryAccessor : public RegistryAccessor
    {
    public:
        MemoryRegistryAccessor();

        /// Copy the current contents of another accessor.
        static Result<std::unique_ptr<MemoryRegistryAccessor>> copy_of(const RegistryAccessor& source);

        Result<VariableSet> read(Scope scope) const override;
        bool has_write_access(Scope scope) const override;

        /// Store a variable without counting a write or broadcasting.
        void seed(Variable variable);

        /// Replace a whole scope without counting a write or broadcasting.
        void seed(VariableSet set);

        void set_elevated(bool elevated) { m_elevated = elevated; }

        /// Let @p count more writes/removes succeed, then fail with IoError.
        void fail_after(size_t count) { m_writes_until_failure = count; }

        /// Let all writes succeed again.
        void clear_failure() { m_writes_until_failure.reset(); }

        using WriteHook = std::function<void(const Variable& variable)>;

        /// Call @p hook before each write is stored (tests that pause an apply).
        void set_write_hook(WriteHook hook) { m_write_hook = std::move(hook); }

        size_t broadcast_count() const { return m_broadcast_count; }
        size_t write_count() const { return m_write_count; }

    private:
        Result<void> do_write(const Variable& variable) override;
        Result<void> do_remove(Scope scope, std::string_view name) override;
        bool do_broadcast() override;

        Result<void> check_writable(Scope scope, std::string_view name);
        VariableSet& set_for(Scope scope) { return scope == Scope::User ? m_user : m_system; }

        VariableSet m_user{Scope::User};
        VariableSet m_system{Scope::System};
        bool m_elevated = false;
        std::optional<size_t> m_writes_until_failure;
        WriteHook m_write_hook;
        size_t m_broadcast_count = 0;
        size_t m_write_count = 0;
    };

} // namespace envmgr
