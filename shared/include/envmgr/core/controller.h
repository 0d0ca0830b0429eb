#pragma once

// =============================================================================
// envmgr/core/controller.h - Public operations of the engine
// =============================================================================

#include <envmgr/backup/backup_manager.h>
#include <envmgr/codecs/codec.h>
#include <envmgr/core/change_listener.h>
#include <envmgr/core/config.h>
#include <envmgr/core/error.h>
#include <envmgr/core/types.h>
#include <envmgr/core/validator.h>
#include <envmgr/history/undo_stack.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace envmgr
{

    class RegistryAccessor;

    /// Phase of the operation currently in progress.
    enum class ControllerState
    {
        Idle,
        Validating,
        BackingUp,
        Applying,
        Notifying
    };

    const char* controller_state_to_string(ControllerState state);

    /// Cooperative cancellation for long operations. Honored until Applying begins.
    class CancellationToken
    {
    public:
        void cancel() { m_cancelled = true; }
        bool is_cancelled() const { return m_cancelled; }

    private:
        std::atomic<bool> m_cancelled{false};
    };

    enum class SearchField
    {
        Name,
        Value,
        Both
    };

    struct SearchQuery
    {
        std::string text;
        SearchField field = SearchField::Both;
        bool case_sensitive = false;
        std::optional<Scope> scope; ///< Both scopes if not set
    };

    /// Per-segment findings of a PathLike variable.
    struct SegmentInfo
    {
        size_t index = 0;
        std::string text;
        std::vector<ValidationIssue> issues;
    };

    /// Result of a successful mutation.
    struct Outcome
    {
        std::optional<std::string> snapshot_id; ///< Pre-mutation snapshot, if one was taken
        std::vector<std::string> applied;       ///< Names written or removed
        std::vector<std::string> skipped;       ///< Names left untouched
        std::vector<ValidationIssue> warnings;  ///< Non-fatal validator findings
    };

    /// One history entry as presented to callers.
    struct HistoryEntry
    {
        std::string description;
        CommandKind kind = CommandKind::Add;
        std::vector<Scope> scopes;
        std::vector<std::string> names;
        bool undone = false; ///< true for redo-future entries
    };

    /// Orchestrates validation, backup, registry writes, history and notification.
    ///
    /// Every mutation runs Idle -> Validating -> BackingUp -> Applying -> Notifying -> Idle.
    /// Failures before Applying leave the registry untouched; failures during Applying
    /// are reported with what was applied and the pre-mutation snapshot id.
    /// Mutations are serialized; read-only operations run concurrently with each other.
    class EnvironmentController
    {
        PNQ_DECLARE_NON_COPYABLE(EnvironmentController)

    public:
        EnvironmentController(RegistryAccessor& accessor, EngineConfig config);
        ~EnvironmentController();

        const EngineConfig& config() const { return m_config; }
        ControllerState state() const { return m_state; }

        /// Replace the directory probe used for NonExistentDirectory checks (tests).
        void set_directory_probe(DirectoryProbe probe);

        /// @name Reads
        /// @{
        Result<VariableSet> read(Scope scope) const;
        Result<Variable> get(Scope scope, std::string_view name) const;
        Result<std::vector<Variable>> search(const SearchQuery& query) const;
        Result<std::vector<SegmentInfo>> inspect_segments(Scope scope, std::string_view name) const;
        /// @}

        /// @name Single variable edits
        /// @{
        Result<Outcome> add(Scope scope, std::string name, std::string value);
        Result<Outcome> update(Scope scope, std::string_view name, std::string value);
        Result<Outcome> remove(Scope scope, std::string_view name);
        /// @}

        /// @name PathLike segment edits
        /// @{
        Result<Outcome> set_segments(Scope scope, std::string_view name, std::vector<std::string> segments);

        /// Insert a segment; appends if @p position is not set. Creates the variable if absent.
        Result<Outcome> insert_segment(Scope scope, std::string_view name, std::string_view segment,
                                       std::optional<size_t> position = std::nullopt);

        /// Remove every segment equal (case-insensitive, normalized) to @p segment.
        Result<Outcome> remove_segment(Scope scope, std::string_view name, std::string_view segment);

        Result<Outcome> move_segment(Scope scope, std::string_view name, size_t from, size_t to);
        Result<Outcome> remove_duplicate_segments(Scope scope, std::string_view name);
        Result<Outcome> remove_missing_segments(Scope scope, std::string_view name);
        /// @}

        /// @name Import / export
        /// @{
        Result<Outcome> bulk_import(const ImportBatch& batch, ConflictPolicy policy,
                                    const CancellationToken* cancel = nullptr);
        Result<Outcome> import_data(Format format, std::span<const uint8_t> data, ConflictPolicy policy,
                                    const CancellationToken* cancel = nullptr);

        /// Encode one scope, or both if @p scope is not set.
        Result<Bytes> export_all(Format format, std::optional<Scope> scope = std::nullopt) const;
        /// @}

        /// @name History
        /// @{
        Result<Outcome> undo();
        Result<Outcome> redo();
        bool can_undo() const;
        bool can_redo() const;

        /// Undoable entries oldest first, followed by redo-future entries (undone = true).
        std::vector<HistoryEntry> history() const;
        /// @}

        /// @name Backups
        /// @{
        Result<Outcome> restore(std::string_view snapshot_id);
        Result<SnapshotInfo> create_backup(const std::vector<Scope>& scopes, std::string description);
        Result<std::vector<SnapshotInfo>> list_backups() const;
        Result<void> delete_backup(std::string_view id);
        Result<std::vector<std::string>> prune_backups();
        /// @}

        /// @name Change listeners
        /// @{
        void add_listener(IChangeListener* listener);
        void remove_listener(IChangeListener* listener);
        /// @}

    private:
        enum class HistoryMode
        {
            Record, ///< Push a new command
            Undo,   ///< Move the newest command to redo-future
            Redo    ///< Move the next redo command back to history
        };

        /// A mutation prepared during Validating.
        struct Plan
        {
            CommandKind kind = CommandKind::Add;
            std::string description;
            std::vector<Change> changes;
            Outcome outcome;
            bool force_snapshot = false;
        };

        class StateGuard;

        Result<VariableSet> read_classified(Scope scope) const;
        Variable make_variable(Scope scope, std::string name, std::string value, ValueType type) const;
        DirectoryProbe active_probe() const;

        /// Validate a new state against the previous one; only newly introduced segment issues are fatal.
        Result<std::vector<ValidationIssue>> check_variable(const Variable& variable, const Variable* previous) const;

        Result<Plan> plan_segment_change(Scope scope, std::string_view name, CommandKind kind, std::string description,
                                         const std::function<Result<std::vector<std::string>>(std::vector<std::string>)>& edit) const;

        /// Privilege check, snapshot, apply, history update and broadcast.
        Result<Outcome> execute(Plan plan, HistoryMode mode, const CancellationToken* cancel);
        Result<void> apply_change(const Change& change);

        /// Run a mutation under the exclusive lock and notify listeners afterwards.
        Result<Outcome> mutate(const std::function<Result<Outcome>()>& body);
        void notify_listeners(const ChangeNotice& notice);

        RegistryAccessor& m_accessor;
        const EngineConfig m_config;
        BackupManager m_backups;
        UndoStack m_history;
        DirectoryProbe m_probe;
        std::atomic<ControllerState> m_state{ControllerState::Idle};
        std::optional<ChangeNotice> m_pending_notice;
        mutable std::shared_mutex m_mutex;

        std::mutex m_listener_mutex;
        std::vector<IChangeListener*> m_listeners;
    };

} // namespace envmgr
