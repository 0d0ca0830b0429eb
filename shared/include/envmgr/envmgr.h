#pragma once

// =============================================================================
// envmgr.h - Master include for the envmgr library
// =============================================================================
//
// OVERVIEW
// --------
// envmgr edits the persistent Windows environment variables of the current
// user (HKCU\Environment) and of the machine (HKLM\...\Session Manager\Environment).
// Every change is validated, preceded by an automatic snapshot, recorded for
// undo/redo and announced to running processes with WM_SETTINGCHANGE.
//
// TERMINOLOGY
// -----------
// - Scope:      User or System. Selects the registry key a variable lives in.
//
// - PathLike:   A variable whose value is a ';'-separated list of segments
//               (PATH, PSMODULEPATH, ...). Segment edits only apply to these.
//
// - Snapshot:   Zip archive with a manifest plus a TOML and a .reg export of
//               one or both scopes. Immutable once written.
//
// - Command:    A reversible record of applied changes. Kept by the UndoStack.
//
// - Codec:      TOML, CSV or .reg encoder/decoder used for import and export.
//
// HEADER STRUCTURE
// ----------------
// envmgr/
//   envmgr.h            <- You are here (master include)
//   core/
//     types.h            - Scope, Variable, VariableSet
//     error.h            - ErrorCode, Error, Result<T>
//     config.h           - EngineConfig and retention/conflict policies
//     segments.h         - Segment splitting and normalization
//     validator.h        - Name, value and segment checks
//     change_listener.h  - IChangeListener notification interface
//     controller.h       - EnvironmentController (public operations)
//   registry/
//     accessor.h         - RegistryAccessor ABC and ChangeBatch
//     win32_accessor.h   - Live registry implementation
//     memory_accessor.h  - In-memory implementation (tests, --simulate)
//   codecs/
//     codec.h            - ICodec, Format, ImportRecord
//     toml_codec.h       - TOML
//     csv_codec.h        - CSV
//     reg_codec.h        - Windows Registry Editor 5.00 files
//   snapshot/
//     snapshot.h         - SnapshotInfo manifest and Snapshot contents
//     archive_writer.h   - Zip writer
//     archive_reader.h   - Zip reader
//   backup/
//     backup_manager.h   - Snapshot creation, listing, pruning
//     snapshot_catalog.h - SQLite manifest cache
//   history/
//     command.h          - Command (refcounted change record)
//     undo_stack.h       - Bounded undo/redo stacks
//

#include <envmgr/core/types.h>
#include <envmgr/core/error.h>
#include <envmgr/core/config.h>
#include <envmgr/core/segments.h>
#include <envmgr/core/validator.h>
#include <envmgr/core/change_listener.h>
#include <envmgr/core/controller.h>
#include <envmgr/registry/accessor.h>
#include <envmgr/registry/win32_accessor.h>
#include <envmgr/registry/memory_accessor.h>
#include <envmgr/codecs/codec.h>
#include <envmgr/backup/backup_manager.h>
#include <envmgr/history/undo_stack.h>

namespace envmgr
{
    /// Library version string.
    constexpr const char* version() { return "0.1.0"; }
}
