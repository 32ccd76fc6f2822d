#include "tddbatch/common/batch_scheduler.hpp"
#include "tddbatch/common/dependency_resolver.hpp"
#include "tddbatch/common/logging.hpp"
#include "tddbatch/common/scheduler_config.hpp"
#include "tddbatch/common/scheduler_errors.hpp"
#include "tddbatch/common/task_parser.hpp"
#include "tddbatch/execution/execution_coordinator.hpp"
#include "tddbatch/execution/run_report.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

using namespace tddbatch;

namespace
{

constexpr const char* k_version = "0.1.0";

struct CliOptions
{
    std::string tasks_file;
    std::string config_file;
    bool plan_only{false};
};

void print_usage(const char* prog_name)
{
    std::cout << "tddbatch v" << k_version << "\n\n";
    std::cout << "Usage: " << prog_name << " <tasks-file> [--config <json>] [--plan]\n";
    std::cout << "       " << prog_name << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  tasks-file      Ordered task list, one task per line\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config    JSON configuration file\n";
    std::cout << "  -p, --plan      Print batches and groups without executing\n";
    std::cout << "  -h, --help      Show this help message\n";
    std::cout << "  -v, --version   Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  TDDBATCH_LOG_LEVEL   Log level (error, warn, info, debug, trace)\n\n";
    std::cout << "Exit status:\n";
    std::cout << "  0  every task completed\n";
    std::cout << "  1  the task list, its dependencies or the configuration are invalid\n";
    std::cout << "  2  some tasks failed or were blocked\n";
    std::cout << "  3  the run was aborted (checkpoint, tracker or test suite failure)\n";
}

/// Path of `path` relative to `root`, or nullopt when it lies outside.
std::optional<std::string> relative_to(const std::string& path, const std::string& root)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path rel = fs::relative(fs::weakly_canonical(path, ec), fs::weakly_canonical(root, ec), ec);
    if (ec || rel.empty() || *rel.begin() == "..")
    {
        return std::nullopt;
    }
    return rel.generic_string();
}

/// The scheduler's own files, which checkpoints must never pick up.
std::vector<std::string> own_state_paths(const SchedulerConfig& config)
{
    std::vector<std::string> excluded;
    for (const auto& file : {config.status_file,
                             config.status_file.empty() ? std::string{} : config.status_file + ".tmp",
                             config.failure_ledger_file})
    {
        if (file.empty())
        {
            continue;
        }
        if (auto rel = relative_to(file, config.workspace_root))
        {
            excluded.push_back(*rel);
        }
    }
    return excluded;
}

int run(const CliOptions& options)
{
    SchedulerConfig config;
    if (!options.config_file.empty())
    {
        config = load_config_file(options.config_file);
    }
    config.validate();

    TaskParser parser(config.make_domain_classifier());
    const TaskList parsed = parser.parse_file(options.tasks_file);
    spdlog::info("parsed {} task(s) from {}", parsed.size(), options.tasks_file);

    DependencyResolver resolver;
    const TaskList resolved = resolver.resolve(parsed);

    BatchScheduler scheduler(config.max_batch_size, config.max_group_size);
    const std::vector<Group> groups = scheduler.schedule(resolved);

    if (options.plan_only)
    {
        std::cout << describe_plan(groups);
        return k_exit_success;
    }

    ExecutionCollaborators collaborators;
    if (config.status_file.empty())
    {
        collaborators.tracker = std::make_shared<InMemoryStatusTracker>();
    }
    else
    {
        collaborators.tracker = std::make_shared<JsonFileStatusTracker>(config.status_file);
    }
    if (config.worker_command.empty())
    {
        throw ConfigError("worker_command is required to execute tasks (use --plan to only plan)");
    }
    collaborators.worker = std::make_shared<CommandWorker>(config.worker_command, config.workspace_root);

    auto evidence_classifier = std::make_shared<MarkerEvidenceClassifier>(config.evidence_markers);
    collaborators.evidence_classifier = evidence_classifier;
    if (!config.test_command.empty())
    {
        collaborators.test_runner = std::make_shared<CommandTestRunner>(
            config.test_command, config.workspace_root, evidence_classifier, config.task_timeout);
    }
    else
    {
        spdlog::warn("no test_command configured; cleanup tasks will be blocked");
    }

    collaborators.workspace =
        std::make_shared<GitWorkspace>(config.workspace_root, own_state_paths(config));
    collaborators.rollback = std::make_shared<RollbackManager>(
        collaborators.tracker, collaborators.workspace, config.failure_ledger_file);

    ExecutionCoordinator coordinator(config, collaborators);
    const RunReport report = coordinator.run(groups);

    std::cout << format_report(report);
    return report.exit_code();
}

} // namespace

int main(int argc, char** argv)
{
    init_logging();

    CliOptions options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            print_usage(argv[0]);
            return k_exit_success;
        }
        if (arg == "-v" || arg == "--version")
        {
            std::cout << k_version << "\n";
            return k_exit_success;
        }
        if (arg == "-c" || arg == "--config")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: --config requires a path\n";
                return k_exit_preflight_error;
            }
            options.config_file = argv[++i];
        }
        else if (arg == "-p" || arg == "--plan")
        {
            options.plan_only = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << "\n";
            return k_exit_preflight_error;
        }
        else if (options.tasks_file.empty())
        {
            options.tasks_file = arg;
        }
        else
        {
            std::cerr << "Error: unexpected argument " << arg << "\n";
            return k_exit_preflight_error;
        }
    }

    if (options.tasks_file.empty())
    {
        print_usage(argv[0]);
        return k_exit_preflight_error;
    }

    try
    {
        return run(options);
    }
    catch (const DependencyError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        if (const auto& diagnostics = e.diagnostics())
        {
            const auto offenders = diagnostics->offending_tasks();
            if (!offenders.empty())
            {
                std::cerr << "Offending tasks: " << join_ids(offenders) << "\n";
            }
        }
        return k_exit_preflight_error;
    }
    catch (const SchedulerError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return e.code() == SchedulerErrorCode::Commit ||
                       e.code() == SchedulerErrorCode::TrackerInconsistency
                   ? k_exit_aborted
                   : k_exit_preflight_error;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return k_exit_aborted;
    }
}
