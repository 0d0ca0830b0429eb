#include "pch.h"
#include <envmgr/envmgr.h>
#include <pnq/console.h>
#include <argparse/argparse.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "settings.h"

// Color shortcuts
#define C_RESET   CONSOLE_STANDARD
#define C_BOLD    CONSOLE_FOREGROUND_BRIGHT_WHITE
#define C_DIM     CONSOLE_FOREGROUND_BRIGHT_BLACK
#define C_GREEN   CONSOLE_FOREGROUND_GREEN
#define C_YELLOW  CONSOLE_FOREGROUND_YELLOW
#define C_RED     CONSOLE_FOREGROUND_RED
#define C_CYAN    CONSOLE_FOREGROUND_CYAN

namespace con = pnq::console;
namespace fs = std::filesystem;

bool g_verbose = false;

void print_error(const std::string& msg)
{
    con::write(C_RED "error: " C_RESET);
    con::write_line(msg);
}

void print_success(const std::string& msg)
{
    con::write(C_GREEN);
    con::write_line(msg);
    con::write(C_RESET);
}

void print_verbose(const std::string& msg)
{
    if (g_verbose)
    {
        con::write(C_DIM);
        con::write_line(msg);
        con::write(C_RESET);
    }
}

void print_issue(const envmgr::ValidationIssue& issue)
{
    con::write(issue.fatal ? C_RED "  [" : C_YELLOW "  [");
    con::write(envmgr::issue_kind_to_string(issue.kind));
    con::write("]" C_RESET " ");
    if (issue.segment_index)
        con::write(std::format(C_DIM "segment {}: " C_RESET, *issue.segment_index));
    con::write_line(issue.message);
}

int report(const envmgr::Error& error)
{
    print_error(error.to_string());
    for (const auto& issue : error.issues)
        print_issue(issue);

    if (!error.names.empty())
    {
        con::write(C_DIM "  names: " C_RESET);
        con::write_line(pnq::string::join(error.names, ", "));
    }
    if (error.snapshot_id)
    {
        con::write(C_DIM "  restore point: " C_RESET);
        con::write_line(*error.snapshot_id);
    }
    return 1;
}

int report(const envmgr::Result<envmgr::Outcome>& result, const std::string& success)
{
    if (!result)
        return report(result.error());

    for (const auto& warning : result->warnings)
        print_issue(warning);

    if (result->applied.empty())
    {
        con::write_line(C_DIM "Nothing changed" C_RESET);
        return 0;
    }

    print_success(success);
    if (!result->skipped.empty())
    {
        con::write(C_YELLOW "Skipped: " C_RESET);
        con::write_line(pnq::string::join(result->skipped, ", "));
    }
    if (result->snapshot_id)
        print_verbose("Restore point: " + *result->snapshot_id);
    return 0;
}

/// Prints committed changes in verbose mode.
class ConsoleChangeListener final : public envmgr::IChangeListener
{
public:
    void on_environment_changed(const envmgr::ChangeNotice& notice) override
    {
        print_verbose(std::format("{}: {}", notice.operation, pnq::string::join(notice.names, ", ")));
    }
};

bool parse_scope_arg(const std::string& text, envmgr::Scope& scope)
{
    if (envmgr::parse_scope(text, scope))
        return true;

    print_error("Unknown scope '" + text + "' (expected user or system)");
    return false;
}

void print_variable(const envmgr::Variable& variable)
{
    con::write(C_CYAN);
    con::write(variable.name);
    con::write(C_RESET " = ");
    con::write(variable.value);
    if (variable.type == envmgr::ValueType::ExpandString)
        con::write(C_DIM "  (expand)" C_RESET);
    con::write_line("");
}

// ============================================================================
// Variable commands
// ============================================================================

int cmd_list(envmgr::EnvironmentController& controller, const std::string& scope_arg, const std::string& filter)
{
    envmgr::SearchQuery query;
    query.text = filter;
    if (!scope_arg.empty())
    {
        envmgr::Scope scope;
        if (!parse_scope_arg(scope_arg, scope))
            return 1;
        query.scope = scope;
    }

    auto variables = controller.search(query);
    if (!variables)
        return report(variables.error());

    for (const envmgr::Scope scope : envmgr::ALL_SCOPES)
    {
        if (query.scope && *query.scope != scope)
            continue;

        con::format_line(C_BOLD "[{}]" C_RESET, envmgr::scope_to_string(scope));
        for (const auto& variable : *variables)
        {
            if (variable.scope != scope)
                continue;
            con::write("  ");
            print_variable(variable);
        }
        con::write_line("");
    }
    return 0;
}

int cmd_get(envmgr::EnvironmentController& controller, envmgr::Scope scope, const std::string& name)
{
    auto variable = controller.get(scope, name);
    if (!variable)
        return report(variable.error());

    if (variable->kind == envmgr::VariableKind::PathLike)
    {
        con::format_line(C_BOLD "{}" C_RESET C_DIM " ({})" C_RESET, variable->name, envmgr::scope_to_string(scope));
        for (const auto& segment : envmgr::split_segments(variable->value))
        {
            con::write("  ");
            con::write_line(segment);
        }
        return 0;
    }

    print_variable(*variable);
    return 0;
}

int cmd_set(envmgr::EnvironmentController& controller, envmgr::Scope scope, const std::string& name, const std::string& value)
{
    auto existing = controller.get(scope, name);
    if (!existing && existing.error().code != envmgr::ErrorCode::NotFound)
        return report(existing.error());

    if (existing)
        return report(controller.update(scope, name, value), "Updated " + existing->name);
    return report(controller.add(scope, name, value), "Added " + name);
}

int cmd_delete(envmgr::EnvironmentController& controller, envmgr::Scope scope, const std::string& name)
{
    return report(controller.remove(scope, name), "Deleted " + name);
}

// ============================================================================
// Path commands
// ============================================================================

int cmd_path_show(envmgr::EnvironmentController& controller, envmgr::Scope scope, const std::string& name)
{
    auto segments = controller.inspect_segments(scope, name);
    if (!segments)
        return report(segments.error());

    for (const auto& segment : *segments)
    {
        const bool has_error = std::any_of(segment.issues.begin(), segment.issues.end(),
                                           [](const envmgr::ValidationIssue& i) { return i.fatal; });
        con::write(std::format(C_DIM "{:3} " C_RESET, segment.index));
        if (has_error)
            con::write(C_RED);
        else if (!segment.issues.empty())
            con::write(C_YELLOW);
        con::write(segment.text.empty() ? std::string{"<empty>"} : segment.text);
        con::write_line(C_RESET);

        for (const auto& issue : segment.issues)
        {
            con::write("      ");
            con::write_line(issue.message);
        }
    }
    return 0;
}

// ============================================================================
// Import / export
// ============================================================================

bool resolve_format(const std::string& format_arg, const std::string& path, envmgr::Format& format)
{
    if (!format_arg.empty())
    {
        if (envmgr::parse_format(format_arg, format))
            return true;
        print_error("Unknown format '" + format_arg + "' (expected toml, csv or reg)");
        return false;
    }

    format = envmgr::format_from_extension(path).value_or(envmgr::Format::Toml);
    return true;
}

int cmd_export(envmgr::EnvironmentController& controller, const std::string& output, const std::string& format_arg,
               const std::string& scope_arg)
{
    envmgr::Format format;
    if (!resolve_format(format_arg, output, format))
        return 1;

    std::optional<envmgr::Scope> scope;
    if (!scope_arg.empty())
    {
        envmgr::Scope parsed;
        if (!parse_scope_arg(scope_arg, parsed))
            return 1;
        scope = parsed;
    }

    auto bytes = controller.export_all(format, scope);
    if (!bytes)
        return report(bytes.error());

    if (output.empty())
    {
        con::write(envmgr::decode_text(*bytes));
        return 0;
    }

    std::ofstream file{output, std::ios::binary | std::ios::trunc};
    file.write(reinterpret_cast<const char*>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
    if (!file)
    {
        print_error("Failed to write " + output);
        return 1;
    }

    print_success(std::format("Exported to {} ({})", output, envmgr::format_to_string(format)));
    return 0;
}

int cmd_import(envmgr::EnvironmentController& controller, const std::string& input, const std::string& format_arg,
               const std::string& policy_arg)
{
    envmgr::Format format;
    if (!resolve_format(format_arg, input, format))
        return 1;

    envmgr::ConflictPolicy policy;
    if (pnq::string::equals_nocase(policy_arg, "skip"))
        policy = envmgr::ConflictPolicy::Skip;
    else if (pnq::string::equals_nocase(policy_arg, "overwrite"))
        policy = envmgr::ConflictPolicy::Overwrite;
    else if (pnq::string::equals_nocase(policy_arg, "fail"))
        policy = envmgr::ConflictPolicy::Fail;
    else
    {
        print_error("Unknown policy '" + policy_arg + "' (expected skip, overwrite or fail)");
        return 1;
    }

    std::ifstream file{input, std::ios::binary};
    if (!file)
    {
        print_error("Failed to open " + input);
        return 1;
    }
    const envmgr::Bytes data{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};

    auto result = controller.import_data(format, data, policy);
    return report(result, result ? std::format("Imported {} variable(s)", result->applied.size()) : std::string{});
}

// ============================================================================
// Backup commands
// ============================================================================

int cmd_backup_create(envmgr::EnvironmentController& controller, const std::string& scope_arg, const std::string& description)
{
    std::vector<envmgr::Scope> scopes;
    if (scope_arg.empty())
        scopes.assign(std::begin(envmgr::ALL_SCOPES), std::end(envmgr::ALL_SCOPES));
    else
    {
        envmgr::Scope scope;
        if (!parse_scope_arg(scope_arg, scope))
            return 1;
        scopes.push_back(scope);
    }

    auto info = controller.create_backup(scopes, description);
    if (!info)
        return report(info.error());

    print_success("Created snapshot " + info->id);
    print_verbose(info->path);
    return 0;
}

int cmd_backup_list(envmgr::EnvironmentController& controller)
{
    auto snapshots = controller.list_backups();
    if (!snapshots)
        return report(snapshots.error());

    if (snapshots->empty())
    {
        con::write_line(C_DIM "No snapshots" C_RESET);
        return 0;
    }

    for (const auto& info : *snapshots)
    {
        std::vector<std::string> scope_names;
        for (const auto scope : info.scopes)
            scope_names.emplace_back(envmgr::scope_to_string(scope));

        con::write(C_CYAN);
        con::write(info.id);
        con::write(C_RESET "  ");
        con::write(pnq::string::join(scope_names, "+"));
        if (info.automatic)
            con::write(C_DIM "  auto" C_RESET);
        con::write("  ");
        con::write_line(info.description);
    }
    return 0;
}

int cmd_backup_restore(envmgr::EnvironmentController& controller, const std::string& id)
{
    return report(controller.restore(id), "Restored " + id);
}

int cmd_backup_delete(envmgr::EnvironmentController& controller, const std::string& id)
{
    auto result = controller.delete_backup(id);
    if (!result)
        return report(result.error());

    print_success("Deleted snapshot " + id);
    return 0;
}

int cmd_backup_prune(envmgr::EnvironmentController& controller)
{
    auto removed = controller.prune_backups();
    if (!removed)
        return report(removed.error());

    for (const auto& id : *removed)
        print_verbose("Removed " + id);
    print_success(std::format("Pruned {} snapshot(s)", removed->size()));
    return 0;
}

// ============================================================================
// Startup
// ============================================================================

static void initialize_logging(envmgr::config::RootSettings& settings)
{
    std::string log_file_path = settings.logging.logFilePath.get();
    if (log_file_path.empty())
        log_file_path = (fs::path{envmgr::config::RootSettings::default_data_path()} / "envmgr.log").string();

    try
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file_path, false);
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(g_verbose ? spdlog::level::debug : spdlog::level::warn);

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("envmgr", sinks.begin(), sinks.end());

        const std::string log_level = settings.logging.logLevel.get();
        logger->set_level(g_verbose ? spdlog::level::debug : spdlog::level::from_str(log_level));
        logger->flush_on(spdlog::level::trace);

        spdlog::set_default_logger(logger);
        spdlog::debug("Logging initialized - file: {}, level: {}", log_file_path, log_level);
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        // Fall back to console only
        spdlog::error("Failed to create file logger: {}", ex.what());
    }
}

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("envmgr", envmgr::version());
    program.add_description("Windows environment variable manager");

    // Global options
    program.add_argument("-v", "--verbose")
        .help("Enable verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--simulate")
        .help("Apply changes to an in-memory copy of the registry only")
        .default_value(false)
        .implicit_value(true);

    auto add_scope = [](argparse::ArgumentParser& cmd, const char* default_scope)
    {
        cmd.add_argument("-s", "--scope")
            .help("user or system")
            .default_value(std::string{default_scope});
    };

    // Variable commands
    argparse::ArgumentParser list_cmd("list");
    list_cmd.add_description("List variables");
    add_scope(list_cmd, "");
    list_cmd.add_argument("-f", "--filter")
        .help("Only show variables whose name or value contains this text")
        .default_value(std::string{});

    argparse::ArgumentParser get_cmd("get");
    get_cmd.add_description("Show a single variable");
    get_cmd.add_argument("name");
    add_scope(get_cmd, "user");

    argparse::ArgumentParser set_cmd("set");
    set_cmd.add_description("Create or update a variable");
    set_cmd.add_argument("name");
    set_cmd.add_argument("value");
    add_scope(set_cmd, "user");

    argparse::ArgumentParser delete_cmd("delete");
    delete_cmd.add_description("Delete a variable");
    delete_cmd.add_argument("name");
    add_scope(delete_cmd, "user");

    // Path commands
    argparse::ArgumentParser path_cmd("path");
    path_cmd.add_description("Edit segments of PATH-like variables");

    argparse::ArgumentParser path_show_cmd("show");
    path_show_cmd.add_description("Show segments with validation findings");
    path_show_cmd.add_argument("name").default_value(std::string{"PATH"}).nargs(argparse::nargs_pattern::optional);
    add_scope(path_show_cmd, "user");

    argparse::ArgumentParser path_add_cmd("add");
    path_add_cmd.add_description("Add a segment");
    path_add_cmd.add_argument("segment");
    path_add_cmd.add_argument("-n", "--name").default_value(std::string{"PATH"});
    path_add_cmd.add_argument("-p", "--position")
        .help("Zero-based insert position, or omit to append")
        .scan<'u', size_t>();
    add_scope(path_add_cmd, "user");

    argparse::ArgumentParser path_remove_cmd("remove");
    path_remove_cmd.add_description("Remove every occurrence of a segment");
    path_remove_cmd.add_argument("segment");
    path_remove_cmd.add_argument("-n", "--name").default_value(std::string{"PATH"});
    add_scope(path_remove_cmd, "user");

    argparse::ArgumentParser path_move_cmd("move");
    path_move_cmd.add_description("Move a segment to another position");
    path_move_cmd.add_argument("from").scan<'u', size_t>();
    path_move_cmd.add_argument("to").scan<'u', size_t>();
    path_move_cmd.add_argument("-n", "--name").default_value(std::string{"PATH"});
    add_scope(path_move_cmd, "user");

    argparse::ArgumentParser path_dedupe_cmd("dedupe");
    path_dedupe_cmd.add_description("Remove duplicate segments, keeping the first");
    path_dedupe_cmd.add_argument("-n", "--name").default_value(std::string{"PATH"});
    add_scope(path_dedupe_cmd, "user");

    argparse::ArgumentParser path_prune_cmd("prune");
    path_prune_cmd.add_description("Remove segments pointing to missing directories");
    path_prune_cmd.add_argument("-n", "--name").default_value(std::string{"PATH"});
    add_scope(path_prune_cmd, "user");

    path_cmd.add_subparser(path_show_cmd);
    path_cmd.add_subparser(path_add_cmd);
    path_cmd.add_subparser(path_remove_cmd);
    path_cmd.add_subparser(path_move_cmd);
    path_cmd.add_subparser(path_dedupe_cmd);
    path_cmd.add_subparser(path_prune_cmd);

    // Import / export
    argparse::ArgumentParser export_cmd("export");
    export_cmd.add_description("Export variables (toml, csv or reg)");
    export_cmd.add_argument("output")
        .help("Output file, or omit to print")
        .nargs(argparse::nargs_pattern::optional)
        .default_value(std::string{});
    export_cmd.add_argument("--format").default_value(std::string{});
    add_scope(export_cmd, "");

    argparse::ArgumentParser import_cmd("import");
    import_cmd.add_description("Import variables from a file");
    import_cmd.add_argument("input");
    import_cmd.add_argument("--format").default_value(std::string{});
    import_cmd.add_argument("--policy")
        .help("skip, overwrite or fail")
        .default_value(std::string{"skip"});

    // Backup commands
    argparse::ArgumentParser backup_cmd("backup");
    backup_cmd.add_description("Manage snapshots");

    argparse::ArgumentParser backup_create_cmd("create");
    backup_create_cmd.add_description("Create a snapshot");
    add_scope(backup_create_cmd, "");
    backup_create_cmd.add_argument("-d", "--description").default_value(std::string{"Manual backup"});

    argparse::ArgumentParser backup_list_cmd("list");
    backup_list_cmd.add_description("List snapshots, newest first");

    argparse::ArgumentParser backup_restore_cmd("restore");
    backup_restore_cmd.add_description("Restore the variables captured in a snapshot");
    backup_restore_cmd.add_argument("id");

    argparse::ArgumentParser backup_delete_cmd("delete");
    backup_delete_cmd.add_description("Delete a snapshot");
    backup_delete_cmd.add_argument("id");

    argparse::ArgumentParser backup_prune_cmd("prune");
    backup_prune_cmd.add_description("Apply the retention policy");

    backup_cmd.add_subparser(backup_create_cmd);
    backup_cmd.add_subparser(backup_list_cmd);
    backup_cmd.add_subparser(backup_restore_cmd);
    backup_cmd.add_subparser(backup_delete_cmd);
    backup_cmd.add_subparser(backup_prune_cmd);

    program.add_subparser(list_cmd);
    program.add_subparser(get_cmd);
    program.add_subparser(set_cmd);
    program.add_subparser(delete_cmd);
    program.add_subparser(path_cmd);
    program.add_subparser(export_cmd);
    program.add_subparser(import_cmd);
    program.add_subparser(backup_cmd);

    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err)
    {
        print_error(err.what());
        con::write_line("");
        con::write_line(program.help().str());
        return 1;
    }

    g_verbose = program.get<bool>("--verbose");
    const bool simulate = program.get<bool>("--simulate");

    envmgr::config::RootSettings settings;
    const std::string config_path = envmgr::config::RootSettings::default_config_path();
    if (!settings.load(config_path))
        settings.save(config_path);
    initialize_logging(settings);

    envmgr::EngineConfig engine_config = settings.to_engine_config();

    envmgr::Win32RegistryAccessor live;
    std::unique_ptr<envmgr::MemoryRegistryAccessor> simulated;
    envmgr::RegistryAccessor* accessor = &live;
    if (simulate)
    {
        auto copy = envmgr::MemoryRegistryAccessor::copy_of(live);
        if (!copy)
            return report(copy.error());

        simulated = std::move(*copy);
        simulated->set_elevated(live.has_write_access(envmgr::Scope::System));
        accessor = simulated.get();
        engine_config.auto_backup = false;
        con::write_line(C_YELLOW "Simulation mode: the registry is not modified" C_RESET);
    }

    envmgr::EnvironmentController controller{*accessor, std::move(engine_config)};
    auto* listener = new ConsoleChangeListener();
    controller.add_listener(listener);
    listener->release(REFCOUNT_DEBUG_ARGS);

    auto scope_of = [](argparse::ArgumentParser& cmd, envmgr::Scope& scope)
    {
        return parse_scope_arg(cmd.get<std::string>("--scope"), scope);
    };
    envmgr::Scope scope;

    if (program.is_subcommand_used("list"))
        return cmd_list(controller, list_cmd.get<std::string>("--scope"), list_cmd.get<std::string>("--filter"));

    if (program.is_subcommand_used("get"))
        return scope_of(get_cmd, scope) ? cmd_get(controller, scope, get_cmd.get<std::string>("name")) : 1;

    if (program.is_subcommand_used("set"))
    {
        if (!scope_of(set_cmd, scope))
            return 1;
        return cmd_set(controller, scope, set_cmd.get<std::string>("name"), set_cmd.get<std::string>("value"));
    }

    if (program.is_subcommand_used("delete"))
        return scope_of(delete_cmd, scope) ? cmd_delete(controller, scope, delete_cmd.get<std::string>("name")) : 1;

    if (program.is_subcommand_used("path"))
    {
        if (path_cmd.is_subcommand_used("show"))
            return scope_of(path_show_cmd, scope) ? cmd_path_show(controller, scope, path_show_cmd.get<std::string>("name")) : 1;

        if (path_cmd.is_subcommand_used("add"))
        {
            if (!scope_of(path_add_cmd, scope))
                return 1;
            const auto segment = path_add_cmd.get<std::string>("segment");
            return report(controller.insert_segment(scope, path_add_cmd.get<std::string>("--name"), segment,
                                                    path_add_cmd.present<size_t>("--position")),
                          "Added " + segment);
        }

        if (path_cmd.is_subcommand_used("remove"))
        {
            if (!scope_of(path_remove_cmd, scope))
                return 1;
            const auto segment = path_remove_cmd.get<std::string>("segment");
            return report(controller.remove_segment(scope, path_remove_cmd.get<std::string>("--name"), segment),
                          "Removed " + segment);
        }

        if (path_cmd.is_subcommand_used("move"))
        {
            if (!scope_of(path_move_cmd, scope))
                return 1;
            return report(controller.move_segment(scope, path_move_cmd.get<std::string>("--name"),
                                                  path_move_cmd.get<size_t>("from"), path_move_cmd.get<size_t>("to")),
                          "Moved segment");
        }

        if (path_cmd.is_subcommand_used("dedupe"))
        {
            if (!scope_of(path_dedupe_cmd, scope))
                return 1;
            return report(controller.remove_duplicate_segments(scope, path_dedupe_cmd.get<std::string>("--name")),
                          "Removed duplicate segments");
        }

        if (path_cmd.is_subcommand_used("prune"))
        {
            if (!scope_of(path_prune_cmd, scope))
                return 1;
            return report(controller.remove_missing_segments(scope, path_prune_cmd.get<std::string>("--name")),
                          "Removed missing directories");
        }

        con::write_line(path_cmd.help().str());
        return 0;
    }

    if (program.is_subcommand_used("export"))
        return cmd_export(controller, export_cmd.get<std::string>("output"), export_cmd.get<std::string>("--format"),
                          export_cmd.get<std::string>("--scope"));

    if (program.is_subcommand_used("import"))
        return cmd_import(controller, import_cmd.get<std::string>("input"), import_cmd.get<std::string>("--format"),
                          import_cmd.get<std::string>("--policy"));

    if (program.is_subcommand_used("backup"))
    {
        if (backup_cmd.is_subcommand_used("create"))
            return cmd_backup_create(controller, backup_create_cmd.get<std::string>("--scope"),
                                     backup_create_cmd.get<std::string>("--description"));
        if (backup_cmd.is_subcommand_used("list"))
            return cmd_backup_list(controller);
        if (backup_cmd.is_subcommand_used("restore"))
            return cmd_backup_restore(controller, backup_restore_cmd.get<std::string>("id"));
        if (backup_cmd.is_subcommand_used("delete"))
            return cmd_backup_delete(controller, backup_delete_cmd.get<std::string>("id"));
        if (backup_cmd.is_subcommand_used("prune"))
            return cmd_backup_prune(controller);

        con::write_line(backup_cmd.help().str());
        return 0;
    }

    // No subcommand - show help
    con::write_line(program.help().str());
    return 0;
}
