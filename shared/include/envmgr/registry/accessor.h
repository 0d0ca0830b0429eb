#pragma once

// =============================================================================
// envmgr/registry/accessor.h - Typed access to the environment registry keys
// =============================================================================

#include <envmgr/core/error.h>
#include <envmgr/core/types.h>
#include <pnq/pnq.h>
#include <string_view>

namespace envmgr
{

    /// Full registry key path holding the variables of a scope.
    inline const char* registry_key(Scope scope)
    {
        return scope == Scope::User
                   ? "HKEY_CURRENT_USER\\Environment"
                   : "HKEY_LOCAL_MACHINE\\SYSTEM\\CurrentControlSet\\Control\\Session Manager\\Environment";
    }

    /// Abstract access to both environment scopes.
    ///
    /// Holds no business logic: values are stored and returned verbatim. Every
    /// successful write() or remove() is followed by exactly one change broadcast,
    /// unless a ChangeBatch is open, in which case the batch broadcasts once on close.
    class RegistryAccessor
    {
        PNQ_DECLARE_NON_COPYABLE(RegistryAccessor)

    public:
        RegistryAccessor() = default;
        virtual ~RegistryAccessor() = default;

        /// Read all string variables of a scope.
        virtual Result<VariableSet> read(Scope scope) const = 0;

        /// Create or replace a variable.
        /// @return AccessDenied, InvalidName or IoError on failure
        Result<void> write(const Variable& variable);

        /// Delete a variable.
        /// @return NotFound, AccessDenied or IoError on failure
        Result<void> remove(Scope scope, std::string_view name);

        /// Probe (uncached) whether the caller may write to @p scope.
        virtual bool has_write_access(Scope scope) const = 0;

        /// Tell running processes the environment changed. Failures are logged only.
        void broadcast_change();

    protected:
        virtual Result<void> do_write(const Variable& variable) = 0;
        virtual Result<void> do_remove(Scope scope, std::string_view name) = 0;

        /// @return false if the broadcast did not reach all windows
        virtual bool do_broadcast() = 0;

    private:
        friend class ChangeBatch;

        void on_changed();

        int m_batch_depth = 0;
        bool m_batch_dirty = false;
    };

    /// Groups several writes so that they emit a single change broadcast.
    ///
    /// Nested batches are allowed; only the outermost one broadcasts, and only
    /// if at least one write or remove succeeded inside it.
    class ChangeBatch
    {
        PNQ_DECLARE_NON_COPYABLE(ChangeBatch)

    public:
        explicit ChangeBatch(RegistryAccessor& accessor);
        ~ChangeBatch();

    private:
        RegistryAccessor& m_accessor;
    };

} // namespace envmgr
