#include "pch.h"
#include <envmgr/core/controller.h>
#include <envmgr/core/segments.h>
#include <envmgr/registry/accessor.h>

namespace envmgr
{

namespace
{

Error validation_error(Scope scope, std::string_view name, std::string message, std::vector<ValidationIssue> issues = {})
{
    Error error{ErrorCode::ValidationError, std::move(message)};
    error.scope = scope;
    error.name = std::string{name};
    error.issues = std::move(issues);
    return error;
}

// A REG_SZ value that gains a %reference% becomes REG_EXPAND_SZ; expand values stay expand.
ValueType updated_type(ValueType previous, std::string_view value)
{
    return previous == ValueType::ExpandString ? previous : infer_value_type(value);
}

std::vector<Scope> scopes_of(const std::vector<Change>& changes)
{
    std::vector<Scope> result;
    for (const Scope scope : ALL_SCOPES)
    {
        if (std::any_of(changes.begin(), changes.end(), [scope](const Change& c) { return c.scope == scope; }))
            result.push_back(scope);
    }
    return result;
}

bool matches(std::string_view haystack, std::string_view needle, bool case_sensitive)
{
    return case_sensitive ? pnq::string::contains(haystack, needle) : pnq::string::contains_nocase(haystack, needle);
}

} // anonymous namespace

const char* controller_state_to_string(ControllerState state)
{
    switch (state)
    {
    case ControllerState::Idle:
        return "Idle";
    case ControllerState::Validating:
        return "Validating";
    case ControllerState::BackingUp:
        return "BackingUp";
    case ControllerState::Applying:
        return "Applying";
    case ControllerState::Notifying:
        return "Notifying";
    }
    return "Unknown";
}

/// Enters Validating on construction and returns to Idle when the operation ends.
class EnvironmentController::StateGuard
{
public:
    explicit StateGuard(std::atomic<ControllerState>& state)
        : m_state{state}
    {
        m_state = ControllerState::Validating;
    }

    ~StateGuard()
    {
        m_state = ControllerState::Idle;
    }

private:
    std::atomic<ControllerState>& m_state;
};

EnvironmentController::EnvironmentController(RegistryAccessor& accessor, EngineConfig config)
    : m_accessor{accessor}
    , m_config{std::move(config)}
    , m_backups{accessor, m_config.backup_directory, m_config.path_like_names}
    , m_history{m_config.history_capacity}
    , m_probe{filesystem_directory_probe()}
{
}

EnvironmentController::~EnvironmentController()
{
    std::lock_guard lock{m_listener_mutex};
    for (auto* listener : m_listeners)
        listener->release(REFCOUNT_DEBUG_ARGS);
    m_listeners.clear();
}

void EnvironmentController::set_directory_probe(DirectoryProbe probe)
{
    std::unique_lock lock{m_mutex};
    m_probe = std::move(probe);
}

// ============================================================================
// Reads
// ============================================================================

Result<VariableSet> EnvironmentController::read_classified(Scope scope) const
{
    auto raw = m_accessor.read(scope);
    if (!raw)
        return std::unexpected(raw.error());

    VariableSet set{scope};
    for (Variable variable : *raw)
    {
        variable.kind = classify(variable.name, m_config.path_like_names);
        set.upsert(std::move(variable));
    }
    return set;
}

Variable EnvironmentController::make_variable(Scope scope, std::string name, std::string value, ValueType type) const
{
    const VariableKind kind = classify(name, m_config.path_like_names);
    return Variable{scope, std::move(name), std::move(value), kind, type};
}

DirectoryProbe EnvironmentController::active_probe() const
{
    return m_config.check_directories ? m_probe : DirectoryProbe{};
}

Result<VariableSet> EnvironmentController::read(Scope scope) const
{
    std::shared_lock lock{m_mutex};
    return read_classified(scope);
}

Result<Variable> EnvironmentController::get(Scope scope, std::string_view name) const
{
    std::shared_lock lock{m_mutex};
    auto set = read_classified(scope);
    if (!set)
        return std::unexpected(set.error());

    const Variable* variable = set->find(name);
    if (!variable)
        return make_error(ErrorCode::NotFound, "Variable does not exist", scope, std::string{name});
    return *variable;
}

Result<std::vector<Variable>> EnvironmentController::search(const SearchQuery& query) const
{
    std::shared_lock lock{m_mutex};
    std::vector<Variable> result;

    for (const Scope scope : ALL_SCOPES)
    {
        if (query.scope && *query.scope != scope)
            continue;

        auto set = read_classified(scope);
        if (!set)
            return std::unexpected(set.error());

        for (const auto& variable : *set)
        {
            const bool name_hit = query.field != SearchField::Value && matches(variable.name, query.text, query.case_sensitive);
            const bool value_hit = query.field != SearchField::Name && matches(variable.value, query.text, query.case_sensitive);
            if (name_hit || value_hit)
                result.push_back(variable);
        }
    }
    return result;
}

Result<std::vector<SegmentInfo>> EnvironmentController::inspect_segments(Scope scope, std::string_view name) const
{
    std::shared_lock lock{m_mutex};
    auto set = read_classified(scope);
    if (!set)
        return std::unexpected(set.error());

    const Variable* variable = set->find(name);
    if (!variable)
        return make_error(ErrorCode::NotFound, "Variable does not exist", scope, std::string{name});

    if (variable->kind != VariableKind::PathLike)
        return std::unexpected(validation_error(scope, name, std::format("'{}' is not a path-like variable", name)));

    const auto segments = split_segments(variable->value);
    std::vector<SegmentInfo> result;
    result.reserve(segments.size());
    for (size_t i = 0; i < segments.size(); ++i)
        result.push_back(SegmentInfo{i, segments[i], {}});

    auto issues = Validator::validate_value(variable->kind, variable->value);
    auto segment_issues = Validator::validate_segments(segments, m_probe);
    issues.insert(issues.end(), segment_issues.begin(), segment_issues.end());

    for (auto& issue : issues)
    {
        if (issue.segment_index && *issue.segment_index < result.size())
            result[*issue.segment_index].issues.push_back(std::move(issue));
    }
    return result;
}

// ============================================================================
// Validation and planning
// ============================================================================

Result<std::vector<ValidationIssue>> EnvironmentController::check_variable(const Variable& variable, const Variable* previous) const
{
    auto issues = Validator::validate_variable(variable, active_probe());

    // Segment problems the variable already had are reported but do not block the edit
    if (previous && variable.kind == VariableKind::PathLike)
    {
        const auto previous_segments = split_segments(previous->value);
        std::vector<std::pair<IssueKind, std::string>> existing;
        for (const auto& issue : Validator::validate_variable(*previous))
        {
            if (issue.segment_index && *issue.segment_index < previous_segments.size())
                existing.emplace_back(issue.kind, segment_key(previous_segments[*issue.segment_index]));
        }

        const auto segments = split_segments(variable.value);
        for (auto& issue : issues)
        {
            if (!issue.fatal || !issue.segment_index || *issue.segment_index >= segments.size())
                continue;

            auto it = std::find(existing.begin(), existing.end(),
                                std::make_pair(issue.kind, segment_key(segments[*issue.segment_index])));
            if (it != existing.end())
            {
                existing.erase(it);
                issue.fatal = false;
            }
        }
    }

    if (Validator::has_fatal(issues))
    {
        const auto first = std::find_if(issues.begin(), issues.end(), [](const ValidationIssue& i) { return i.fatal; });
        return std::unexpected(validation_error(variable.scope, variable.name,
                                                std::format("{}: {}", variable.name, first->message), std::move(issues)));
    }
    return issues;
}

Result<EnvironmentController::Plan> EnvironmentController::plan_segment_change(
    Scope scope, std::string_view name, CommandKind kind, std::string description,
    const std::function<Result<std::vector<std::string>>(std::vector<std::string>)>& edit) const
{
    if (classify(name, m_config.path_like_names) != VariableKind::PathLike)
        return std::unexpected(validation_error(scope, name, std::format("'{}' is not a path-like variable", name)));

    auto current = read_classified(scope);
    if (!current)
        return std::unexpected(current.error());

    const Variable* existing = current->find(name);
    auto edited = edit(existing ? split_segments(existing->value) : std::vector<std::string>{});
    if (!edited)
        return std::unexpected(edited.error());

    Variable after = existing ? *existing : make_variable(scope, std::string{name}, {}, ValueType::String);
    after.value = join_segments(*edited);
    after.type = existing ? updated_type(existing->type, after.value) : infer_value_type(after.value);

    auto issues = check_variable(after, existing);
    if (!issues)
        return std::unexpected(issues.error());

    Plan plan;
    plan.kind = kind;
    plan.description = std::move(description);
    plan.changes.push_back(Change{scope, after.name, existing ? std::optional<Variable>{*existing} : std::nullopt, after});
    plan.outcome.warnings = std::move(*issues);
    return plan;
}

// ============================================================================
// Execution
// ============================================================================

Result<void> EnvironmentController::apply_change(const Change& change)
{
    if (change.after)
        return m_accessor.write(*change.after);

    auto result = m_accessor.remove(change.scope, change.name);
    if (!result && result.error().code == ErrorCode::NotFound)
    {
        // Target state "absent" already holds
        spdlog::debug("{}\\{} already absent", scope_to_string(change.scope), change.name);
        return {};
    }
    return result;
}

Result<Outcome> EnvironmentController::execute(Plan plan, HistoryMode mode, const CancellationToken* cancel)
{
    std::erase_if(plan.changes, [](const Change& change) { return change.before == change.after; });

    Outcome outcome = std::move(plan.outcome);
    if (plan.changes.empty())
    {
        spdlog::info("{}: nothing to change", plan.description);
        if (mode == HistoryMode::Undo)
            m_history.commit_undo();
        else if (mode == HistoryMode::Redo)
            m_history.commit_redo();
        return outcome;
    }

    const auto scopes = scopes_of(plan.changes);
    for (const Scope scope : scopes)
    {
        if (!m_accessor.has_write_access(scope))
        {
            spdlog::warn("{}: no write access to {} scope", plan.description, scope_to_string(scope));
            Error error{ErrorCode::AccessDenied,
                        scope == Scope::System ? "Administrator rights are required to change system variables"
                                               : "Write access to user variables denied"};
            error.scope = scope;
            return std::unexpected(std::move(error));
        }
    }

    if (cancel && cancel->is_cancelled())
        return make_error(ErrorCode::Cancelled, std::format("{} cancelled", plan.description));

    m_state = ControllerState::BackingUp;
    if (m_config.auto_backup || plan.force_snapshot)
    {
        auto snapshot = m_backups.snapshot(scopes, std::format("Before {}", plan.description), true);
        if (!snapshot)
        {
            Error error = snapshot.error();
            error.code = ErrorCode::BackupFailed;
            spdlog::error("{}: automatic snapshot failed, nothing applied: {}", plan.description, error.message);
            return std::unexpected(std::move(error));
        }
        outcome.snapshot_id = snapshot->id;

        auto pruned = m_backups.prune(m_config.retention);
        if (!pruned)
            spdlog::warn("Cannot apply backup retention: {}", pruned.error().message);
        else if (!pruned->empty())
            spdlog::info("Retention removed {} old snapshot(s)", pruned->size());
    }

    if (cancel && cancel->is_cancelled())
    {
        Error error{ErrorCode::Cancelled, std::format("{} cancelled", plan.description)};
        error.snapshot_id = outcome.snapshot_id;
        return std::unexpected(std::move(error));
    }

    m_state = ControllerState::Applying;
    std::vector<Change> applied;
    std::optional<Error> failure;
    {
        ChangeBatch batch{m_accessor};
        for (const auto& change : plan.changes)
        {
            auto ok = apply_change(change);
            if (!ok)
            {
                failure = ok.error();
                break;
            }
            applied.push_back(change);
            outcome.applied.push_back(change.name);
        }
        m_state = ControllerState::Notifying;
    }

    if (!applied.empty())
    {
        const char* operation = mode == HistoryMode::Undo   ? "undo"
                                : mode == HistoryMode::Redo ? "redo"
                                                            : command_kind_to_string(plan.kind);
        m_pending_notice = ChangeNotice{operation, scopes_of(applied), outcome.applied};

        if (mode == HistoryMode::Record)
            m_history.push(new Command(plan.kind, plan.description, std::move(applied)));
        else if (!failure && mode == HistoryMode::Undo)
            m_history.commit_undo();
        else if (!failure && mode == HistoryMode::Redo)
            m_history.commit_redo();
    }

    if (failure)
    {
        if (plan.changes.size() == 1)
        {
            failure->snapshot_id = outcome.snapshot_id;
            spdlog::error("{}: {}", plan.description, failure->message);
            return std::unexpected(std::move(*failure));
        }

        Error error{ErrorCode::PartialApplyFailure,
                    std::format("{} of {} changes applied before failure: {}", outcome.applied.size(),
                                plan.changes.size(), failure->message)};
        error.scope = failure->scope;
        error.name = failure->name;
        error.names = outcome.applied;
        error.snapshot_id = outcome.snapshot_id;
        spdlog::error("{}: {}", plan.description, error.message);
        return std::unexpected(std::move(error));
    }

    spdlog::info("{}: applied {} change(s)", plan.description, outcome.applied.size());
    return outcome;
}

Result<Outcome> EnvironmentController::mutate(const std::function<Result<Outcome>()>& body)
{
    Result<Outcome> result;
    std::optional<ChangeNotice> notice;
    {
        std::unique_lock lock{m_mutex};
        StateGuard guard{m_state};
        result = body();
        notice = std::move(m_pending_notice);
        m_pending_notice.reset();
    }

    if (notice)
        notify_listeners(*notice);
    return result;
}

void EnvironmentController::notify_listeners(const ChangeNotice& notice)
{
    std::vector<IChangeListener*> listeners;
    {
        std::lock_guard lock{m_listener_mutex};
        for (auto* listener : m_listeners)
        {
            PNQ_ADDREF(listener);
            listeners.push_back(listener);
        }
    }

    for (auto* listener : listeners)
    {
        listener->on_environment_changed(notice);
        listener->release(REFCOUNT_DEBUG_ARGS);
    }
}

void EnvironmentController::add_listener(IChangeListener* listener)
{
    if (!listener)
        return;

    std::lock_guard lock{m_listener_mutex};
    if (std::find(m_listeners.begin(), m_listeners.end(), listener) != m_listeners.end())
        return;

    PNQ_ADDREF(listener);
    m_listeners.push_back(listener);
}

void EnvironmentController::remove_listener(IChangeListener* listener)
{
    std::lock_guard lock{m_listener_mutex};
    auto it = std::find(m_listeners.begin(), m_listeners.end(), listener);
    if (it == m_listeners.end())
        return;

    m_listeners.erase(it);
    listener->release(REFCOUNT_DEBUG_ARGS);
}

// ============================================================================
// Single variable edits
// ============================================================================

Result<Outcome> EnvironmentController::add(Scope scope, std::string name, std::string value)
{
    return mutate([&]() -> Result<Outcome>
    {
        auto current = read_classified(scope);
        if (!current)
            return std::unexpected(current.error());

        if (current->contains(name))
            return make_error(ErrorCode::AlreadyExists, "Variable already exists", scope, name);

        const ValueType type = infer_value_type(value);
        Variable after = make_variable(scope, name, std::move(value), type);
        auto issues = check_variable(after, nullptr);
        if (!issues)
            return std::unexpected(issues.error());

        Plan plan;
        plan.kind = CommandKind::Add;
        plan.description = std::format("Add {}\\{}", scope_to_string(scope), name);
        plan.changes.push_back(Change{scope, name, std::nullopt, std::move(after)});
        plan.outcome.warnings = std::move(*issues);
        return execute(std::move(plan), HistoryMode::Record, nullptr);
    });
}

Result<Outcome> EnvironmentController::update(Scope scope, std::string_view name, std::string value)
{
    return mutate([&]() -> Result<Outcome>
    {
        auto current = read_classified(scope);
        if (!current)
            return std::unexpected(current.error());

        const Variable* existing = current->find(name);
        if (!existing)
            return make_error(ErrorCode::NotFound, "Variable does not exist", scope, std::string{name});

        Variable after = *existing;
        after.type = updated_type(existing->type, value);
        after.value = std::move(value);

        auto issues = check_variable(after, existing);
        if (!issues)
            return std::unexpected(issues.error());

        Plan plan;
        plan.kind = CommandKind::Update;
        plan.description = std::format("Update {}\\{}", scope_to_string(scope), existing->name);
        plan.changes.push_back(Change{scope, existing->name, *existing, std::move(after)});
        plan.outcome.warnings = std::move(*issues);
        return execute(std::move(plan), HistoryMode::Record, nullptr);
    });
}

Result<Outcome> EnvironmentController::remove(Scope scope, std::string_view name)
{
    return mutate([&]() -> Result<Outcome>
    {
        auto current = read_classified(scope);
        if (!current)
            return std::unexpected(current.error());

        const Variable* existing = current->find(name);
        if (!existing)
            return make_error(ErrorCode::NotFound, "Variable does not exist", scope, std::string{name});

        Plan plan;
        plan.kind = CommandKind::Delete;
        plan.description = std::format("Delete {}\\{}", scope_to_string(scope), existing->name);
        plan.changes.push_back(Change{scope, existing->name, *existing, std::nullopt});
        return execute(std::move(plan), HistoryMode::Record, nullptr);
    });
}

// ============================================================================
// Segment edits
// ============================================================================

Result<Outcome> EnvironmentController::set_segments(Scope scope, std::string_view name, std::vector<std::string> segments)
{
    return mutate([&]() -> Result<Outcome>
    {
        auto plan = plan_segment_change(scope, name, CommandKind::SegmentEdit,
                                        std::format("Set segments of {}\\{}", scope_to_string(scope), name),
                                        [&](std::vector<std::string>) -> Result<std::vector<std::string>> { return segments; });
        if (!plan)
            return std::unexpected(plan.error());
        return execute(std::move(*plan), HistoryMode::Record, nullptr);
    });
}

Result<Outcome> EnvironmentController::insert_segment(Scope scope, std::string_view name, std::string_view segment,
                                                      std::optional<size_t> position)
{
    return mutate([&]() -> Result<Outcome>
    {
        const std::string text = tidy_segment(segment);
        auto edit = [&](std::vector<std::string> segments) -> Result<std::vector<std::string>>
        {
            if (text.empty())
            {
                return std::unexpected(validation_error(scope, name, "Cannot insert an empty segment",
                                                        {ValidationIssue{IssueKind::EmptySegment, "Segment is empty", std::nullopt, true}}));
            }

            // Keep a trailing ';' at the end when appending
            const bool trailing_empty = segments.size() > 1 && segments.back().empty();
            const size_t append_at = trailing_empty ? segments.size() - 1 : segments.size();
            const size_t index = position.value_or(append_at);
            if (index > segments.size())
                return std::unexpected(validation_error(scope, name, std::format("Position {} is out of range (0..{})", index, segments.size())));

            segments.insert(segments.begin() + static_cast<std::ptrdiff_t>(index), text);
            return segments;
        };

        auto plan = plan_segment_change(scope, name, CommandKind::SegmentEdit,
                                        std::format("Add '{}' to {}\\{}", text, scope_to_string(scope), name), edit);
        if (!plan)
            return std::unexpected(plan.error());
        return execute(std::move(*plan), HistoryMode::Record, nullptr);
    });
}

Result<Outcome> EnvironmentController::remove_segment(Scope scope, std::string_view name, std::string_view segment)
{
    return mutate([&]() -> Result<Outcome>
    {
        const std::string key = segment_key(segment);
        auto edit = [&](std::vector<std::string> segments) -> Result<std::vector<std::string>>
        {
            const auto removed = std::erase_if(segments, [&key](const std::string& s) { return segment_key(s) == key; });
            if (removed == 0)
                return make_error(ErrorCode::NotFound, std::format("Segment '{}' not found", segment), scope, std::string{name});
            return segments;
        };

        auto plan = plan_segment_change(scope, name, CommandKind::SegmentEdit,
                                        std::format("Remove '{}' from {}\\{}", segment, scope_to_string(scope), name), edit);
        if (!plan)
            return std::unexpected(plan.error());
        return execute(std::move(*plan), HistoryMode::Record, nullptr);
    });
}

Result<Outcome> EnvironmentController::move_segment(Scope scope, std::string_view name, size_t from, size_t to)
{
    return mutate([&]() -> Result<Outcome>
    {
        auto edit = [&](std::vector<std::string> segments) -> Result<std::vector<std::string>>
        {
            if (from >= segments.size() || to >= segments.size())
            {
                return std::unexpected(validation_error(scope, name,
                                                        std::format("Segment index out of range ({} segments)", segments.size())));
            }

            std::string moved = std::move(segments[from]);
            segments.erase(segments.begin() + static_cast<std::ptrdiff_t>(from));
            segments.insert(segments.begin() + static_cast<std::ptrdiff_t>(to), std::move(moved));
            return segments;
        };

        auto plan = plan_segment_change(scope, name, CommandKind::ReorderSegment,
                                        std::format("Move segment {} to {} in {}\\{}", from, to, scope_to_string(scope), name), edit);
        if (!plan)
            return std::unexpected(plan.error());
        return execute(std::move(*plan), HistoryMode::Record, nullptr);
    });
}

Result<Outcome> EnvironmentController::remove_duplicate_segments(Scope scope, std::string_view name)
{
    return mutate([&]() -> Result<Outcome>
    {
        auto edit = [](std::vector<std::string> segments) -> Result<std::vector<std::string>>
        {
            std::vector<std::string> seen;
            std::vector<std::string> result;
            for (auto& segment : segments)
            {
                const std::string key = segment_key(segment);
                if (!key.empty())
                {
                    if (std::find(seen.begin(), seen.end(), key) != seen.end())
                        continue;
                    seen.push_back(key);
                }
                result.push_back(std::move(segment));
            }
            return result;
        };

        auto plan = plan_segment_change(scope, name, CommandKind::SegmentEdit,
                                        std::format("Remove duplicates from {}\\{}", scope_to_string(scope), name), edit);
        if (!plan)
            return std::unexpected(plan.error());
        return execute(std::move(*plan), HistoryMode::Record, nullptr);
    });
}

Result<Outcome> EnvironmentController::remove_missing_segments(Scope scope, std::string_view name)
{
    return mutate([&]() -> Result<Outcome>
    {
        const DirectoryProbe probe = m_probe;
        auto edit = [&probe](std::vector<std::string> segments) -> Result<std::vector<std::string>>
        {
            std::erase_if(segments, [&probe](const std::string& segment)
            {
                const std::string path = tidy_segment(segment);
                return !path.empty() && path.find('%') == std::string::npos && !probe(path);
            });
            return segments;
        };

        auto plan = plan_segment_change(scope, name, CommandKind::SegmentEdit,
                                        std::format("Remove missing directories from {}\\{}", scope_to_string(scope), name), edit);
        if (!plan)
            return std::unexpected(plan.error());
        return execute(std::move(*plan), HistoryMode::Record, nullptr);
    });
}

// ============================================================================
// Import / export
// ============================================================================

Result<Outcome> EnvironmentController::bulk_import(const ImportBatch& batch, ConflictPolicy policy, const CancellationToken* cancel)
{
    return mutate([&]() -> Result<Outcome>
    {
        for (size_t i = 0; i < batch.size(); ++i)
        {
            for (size_t j = i + 1; j < batch.size(); ++j)
            {
                if (batch[i].scope == batch[j].scope && pnq::string::equals_nocase(batch[i].name, batch[j].name))
                {
                    return std::unexpected(validation_error(batch[j].scope, batch[j].name,
                                                            std::format("'{}' appears more than once in the import", batch[j].name)));
                }
            }
        }

        std::optional<VariableSet> current[2];
        Plan plan;
        plan.kind = CommandKind::BulkImport;
        plan.description = std::format("Import {} record(s)", batch.size());

        std::vector<ValidationIssue> rejected_issues;
        std::vector<std::string> rejected;
        std::vector<std::string> conflicts;

        for (const auto& record : batch)
        {
            auto& set = current[record.scope == Scope::User ? 0 : 1];
            if (!set)
            {
                auto read_result = read_classified(record.scope);
                if (!read_result)
                    return std::unexpected(read_result.error());
                set = std::move(*read_result);
            }

            const Variable* existing = set->find(record.name);
            if (record.action == RecordAction::Delete)
            {
                if (record.name.empty())
                {
                    rejected.push_back(record.name);
                    rejected_issues.push_back(ValidationIssue{IssueKind::EmptyName, "Variable name is empty", std::nullopt, true});
                }
                else if (!existing)
                    plan.outcome.skipped.push_back(record.name);
                else
                    plan.changes.push_back(Change{record.scope, existing->name, *existing, std::nullopt});
                continue;
            }

            Variable after = make_variable(record.scope, existing ? existing->name : record.name, record.value, record.type);
            auto issues = check_variable(after, existing);
            if (!issues)
            {
                rejected.push_back(record.name);
                for (auto& issue : issues.error().issues)
                {
                    issue.message = std::format("{}: {}", record.name, issue.message);
                    rejected_issues.push_back(std::move(issue));
                }
                continue;
            }
            plan.outcome.warnings.insert(plan.outcome.warnings.end(), issues->begin(), issues->end());

            if (existing)
            {
                conflicts.push_back(existing->name);
                if (policy == ConflictPolicy::Skip)
                {
                    plan.outcome.skipped.push_back(existing->name);
                    continue;
                }
                if (policy == ConflictPolicy::Fail)
                    continue;
            }

            plan.changes.push_back(Change{record.scope, after.name,
                                          existing ? std::optional<Variable>{*existing} : std::nullopt, std::move(after)});
        }

        if (!rejected.empty())
        {
            Error error{ErrorCode::ValidationError, std::format("{} record(s) failed validation", rejected.size())};
            error.names = std::move(rejected);
            error.issues = std::move(rejected_issues);
            return std::unexpected(std::move(error));
        }

        if (policy == ConflictPolicy::Fail && !conflicts.empty())
        {
            Error error{ErrorCode::ConflictDetected, std::format("{} variable(s) already exist", conflicts.size())};
            error.names = std::move(conflicts);
            return std::unexpected(std::move(error));
        }

        return execute(std::move(plan), HistoryMode::Record, cancel);
    });
}

Result<Outcome> EnvironmentController::import_data(Format format, std::span<const uint8_t> data, ConflictPolicy policy,
                                                   const CancellationToken* cancel)
{
    const auto codec = create_codec(format, m_config.path_like_names);
    auto batch = codec->decode(data);
    if (!batch)
    {
        spdlog::error("Import failed: {}", batch.error().message);
        return std::unexpected(batch.error());
    }

    spdlog::info("Decoded {} record(s) from {} input", batch->size(), format_to_string(format));
    return bulk_import(*batch, policy, cancel);
}

Result<Bytes> EnvironmentController::export_all(Format format, std::optional<Scope> scope) const
{
    std::shared_lock lock{m_mutex};

    std::vector<VariableSet> sets;
    for (const Scope s : ALL_SCOPES)
    {
        if (scope && *scope != s)
            continue;

        auto set = read_classified(s);
        if (!set)
            return std::unexpected(set.error());
        sets.push_back(std::move(*set));
    }

    return create_codec(format, m_config.path_like_names)->encode(sets);
}

// ============================================================================
// History
// ============================================================================

Result<Outcome> EnvironmentController::undo()
{
    return mutate([this]() -> Result<Outcome>
    {
        const Command* command = m_history.next_undo();
        if (!command)
            return make_error(ErrorCode::NothingToUndo, "Nothing to undo");

        Plan plan;
        plan.kind = command->kind();
        plan.description = std::format("Undo {}", command->description());
        plan.changes = command->inverse();
        return execute(std::move(plan), HistoryMode::Undo, nullptr);
    });
}

Result<Outcome> EnvironmentController::redo()
{
    return mutate([this]() -> Result<Outcome>
    {
        const Command* command = m_history.next_redo();
        if (!command)
            return make_error(ErrorCode::NothingToRedo, "Nothing to redo");

        Plan plan;
        plan.kind = command->kind();
        plan.description = std::format("Redo {}", command->description());
        plan.changes = command->forward();
        return execute(std::move(plan), HistoryMode::Redo, nullptr);
    });
}

bool EnvironmentController::can_undo() const
{
    std::shared_lock lock{m_mutex};
    return m_history.can_undo();
}

bool EnvironmentController::can_redo() const
{
    std::shared_lock lock{m_mutex};
    return m_history.can_redo();
}

std::vector<HistoryEntry> EnvironmentController::history() const
{
    std::shared_lock lock{m_mutex};

    std::vector<HistoryEntry> result;
    auto append = [&result](const Command* command, bool undone)
    {
        result.push_back(HistoryEntry{command->description(), command->kind(), command->scopes(), command->names(), undone});
    };

    for (const auto* command : m_history.history())
        append(command, false);
    for (const auto* command : m_history.future())
        append(command, true);
    return result;
}

// ============================================================================
// Backups
// ============================================================================

Result<Outcome> EnvironmentController::restore(std::string_view snapshot_id)
{
    return mutate([&]() -> Result<Outcome>
    {
        auto snapshot = m_backups.load(snapshot_id);
        if (!snapshot)
            return std::unexpected(snapshot.error());

        Plan plan;
        plan.kind = CommandKind::Restore;
        plan.description = std::format("Restore snapshot {}", snapshot_id);
        plan.force_snapshot = true;

        for (const auto& saved : snapshot->sets)
        {
            auto current = read_classified(saved.scope());
            if (!current)
                return std::unexpected(current.error());

            for (Variable target : saved)
            {
                target.kind = classify(target.name, m_config.path_like_names);
                const Variable* existing = current->find(target.name);
                if (existing && *existing == target)
                    continue;
                plan.changes.push_back(Change{saved.scope(), target.name,
                                              existing ? std::optional<Variable>{*existing} : std::nullopt, target});
            }

            for (const auto& variable : *current)
            {
                if (!saved.contains(variable.name))
                    plan.changes.push_back(Change{saved.scope(), variable.name, variable, std::nullopt});
            }
        }

        return execute(std::move(plan), HistoryMode::Record, nullptr);
    });
}

Result<SnapshotInfo> EnvironmentController::create_backup(const std::vector<Scope>& scopes, std::string description)
{
    std::unique_lock lock{m_mutex};
    return m_backups.snapshot(scopes, std::move(description), false);
}

Result<std::vector<SnapshotInfo>> EnvironmentController::list_backups() const
{
    std::shared_lock lock{m_mutex};
    return m_backups.list();
}

Result<void> EnvironmentController::delete_backup(std::string_view id)
{
    std::unique_lock lock{m_mutex};
    return m_backups.remove(id);
}

Result<std::vector<std::string>> EnvironmentController::prune_backups()
{
    std::unique_lock lock{m_mutex};
    return m_backups.prune(m_config.retention);
}

} // namespace envmgr
