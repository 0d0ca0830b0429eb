#pragma once

// =============================================================================
// envmgr/core/change_listener.h - Notification of committed mutations
// =============================================================================

#include <envmgr/core/types.h>
#include <pnq/ref_counted.h>
#include <string>
#include <vector>

namespace envmgr
{

    /// What a committed mutation touched.
    struct ChangeNotice
    {
        std::string operation;          ///< e.g. "add", "bulk-import", "undo"
        std::vector<Scope> scopes;
        std::vector<std::string> names;
    };

    /// Receives a notice after every mutation that changed the registry,
    /// including partially applied ones.
    /// Refcounted - the controller holds a reference while registered.
    class IChangeListener : public pnq::RefCountImpl
    {
    public:
        /// Called outside the controller lock; listeners may query the controller.
        virtual void on_environment_changed(const ChangeNotice& notice) = 0;
    };

} // namespace envmgr
