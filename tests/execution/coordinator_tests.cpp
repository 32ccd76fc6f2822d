#include <gtest/gtest.h>
#include "tddbatch/common/batch_scheduler.hpp"
#include "tddbatch/common/dependency_resolver.hpp"
#include "tddbatch/common/scheduler_errors.hpp"
#include "tddbatch/common/task_parser.hpp"
#include "tddbatch/execution/execution_coordinator.hpp"
#include "test_fakes.hpp"

using namespace tddbatch;
using tddbatch::test_support::FakeTestRunner;
using tddbatch::test_support::FakeWorker;
using tddbatch::test_support::FakeWorkspace;
using tddbatch::test_support::FileWorker;
using tddbatch::test_support::ScriptedRun;
using tddbatch::test_support::make_task;
using tddbatch::test_support::read_file;
using tddbatch::test_support::write_file;

// =============================================================================
// Test Helpers
// =============================================================================

namespace
{

/**
 * @brief In-memory collaborators shared across one or more runs.
 */
struct CoordinatorFixture
{
    std::shared_ptr<InMemoryStatusTracker> tracker = std::make_shared<InMemoryStatusTracker>();
    std::shared_ptr<FakeWorkspace> workspace = std::make_shared<FakeWorkspace>();
    std::shared_ptr<FakeWorker> worker = std::make_shared<FakeWorker>(workspace);
    std::shared_ptr<FakeTestRunner> runner = std::make_shared<FakeTestRunner>();
    SchedulerConfig config;

    std::vector<Group> plan(const TaskList& tasks) const
    {
        BatchScheduler scheduler(config.max_batch_size, config.max_group_size);
        return scheduler.schedule(DependencyResolver().resolve(tasks));
    }

    std::unique_ptr<ExecutionCoordinator> coordinator() const
    {
        ExecutionCollaborators collaborators;
        collaborators.tracker = tracker;
        collaborators.worker = worker;
        collaborators.test_runner = runner;
        collaborators.workspace = workspace;
        return std::make_unique<ExecutionCoordinator>(config, collaborators);
    }

    RunReport run(const TaskList& tasks) const
    {
        return coordinator()->run(plan(tasks));
    }
};

TaskList reference_tasks()
{
    return {
        make_task(1, TddPhase::FailingTest, DomainTag::Test),
        make_task(2, TddPhase::MakePass, DomainTag::Backend, TaskId("T1")),
        make_task(3, TddPhase::None, DomainTag::Backend),
        make_task(4, TddPhase::None, DomainTag::Backend),
        make_task(5, TddPhase::None, DomainTag::Frontend),
    };
}

TaskList independent_tasks()
{
    return {
        make_task(1, TddPhase::None, DomainTag::Backend),
        make_task(2, TddPhase::None, DomainTag::Backend),
        make_task(3, TddPhase::None, DomainTag::Backend),
    };
}

bool contains(const std::string& text, const std::string& needle)
{
    return text.find(needle) != std::string::npos;
}

} // namespace

// =============================================================================
// Successful runs
// =============================================================================

TEST(CoordinatorTests, Run_ReferenceScenario)
{
    CoordinatorFixture f;
    auto report = f.run(reference_tasks());

    EXPECT_TRUE(report.success());
    EXPECT_EQ(report.exit_code(), k_exit_success);
    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T1", "T2", "T3", "T4", "T5"}));
    EXPECT_TRUE(report.failures.empty());

    ASSERT_EQ(report.checkpoints.size(), 2u);
    EXPECT_EQ(report.checkpoints[0].group_index, 0u);
    EXPECT_EQ(report.checkpoints[0].task_ids, (std::vector<TaskId>{"T1", "T2", "T3", "T4"}));
    EXPECT_EQ(report.checkpoints[1].task_ids, (std::vector<TaskId>{"T5"}));
    EXPECT_EQ(f.workspace->commit_messages(),
              (std::vector<std::string>{"checkpoint: group 0 (T1, T2, T3, T4)",
                                        "checkpoint: group 1 (T5)"}));

    EXPECT_EQ(f.tracker->query_status("T2").commit_ref, std::optional<std::string>("commit-1"));
    EXPECT_EQ(f.tracker->query_status("T5").commit_ref, std::optional<std::string>("commit-2"));
    EXPECT_EQ(f.tracker->checkpoints().size(), 2u);

    // The failing test ran before the task that makes it pass.
    auto calls = f.worker->calls();
    auto t1 = std::find(calls.begin(), calls.end(), "T1");
    auto t2 = std::find(calls.begin(), calls.end(), "T2");
    EXPECT_LT(t1, t2);
}

TEST(CoordinatorTests, Run_SingleThreaded)
{
    CoordinatorFixture f;
    f.config.worker_threads = 1;
    auto report = f.run(reference_tasks());

    EXPECT_EQ(report.exit_code(), k_exit_success);
    EXPECT_EQ(f.worker->calls(), (std::vector<TaskId>{"T1", "T2", "T3", "T4", "T5"}));
}

TEST(CoordinatorTests, Run_NoChangesNoCheckpoint)
{
    CoordinatorFixture f;
    ScriptedRun quiet;
    quiet.touched = std::vector<std::string>{};
    f.worker->script("T1", quiet);

    auto report = f.run({make_task(1)});

    EXPECT_EQ(report.exit_code(), k_exit_success);
    EXPECT_TRUE(report.checkpoints.empty());
    EXPECT_TRUE(f.workspace->commit_messages().empty());
    EXPECT_EQ(f.tracker->query_status("T1").status, TaskStatus::Completed);
    EXPECT_FALSE(f.tracker->query_status("T1").commit_ref.has_value());
}

TEST(CoordinatorTests, Run_WithoutWorkspace)
{
    CoordinatorFixture f;
    ExecutionCollaborators collaborators;
    collaborators.tracker = f.tracker;
    collaborators.worker = std::make_shared<FakeWorker>();
    ExecutionCoordinator coordinator(f.config, collaborators);

    auto report = coordinator.run(f.plan(independent_tasks()));

    EXPECT_EQ(report.exit_code(), k_exit_success);
    EXPECT_TRUE(report.checkpoints.empty());
}

// =============================================================================
// Failure isolation
// =============================================================================

TEST(CoordinatorTests, Failure_RollbackIsolatedToFailedTask)
{
    CoordinatorFixture f;
    ScriptedRun broken;
    broken.success = false;
    broken.evidence = "Traceback: agent lost its context";
    f.worker->script("T2", broken);

    auto report = f.run(independent_tasks());

    EXPECT_EQ(report.exit_code(), k_exit_tasks_unsettled);
    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T1", "T3"}));
    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T2"}));

    ASSERT_EQ(f.workspace->discards().size(), 1u);
    EXPECT_EQ(f.workspace->discards()[0], (std::vector<std::string>{"T2.txt"}));
    ASSERT_EQ(report.checkpoints.size(), 1u);
    EXPECT_EQ(report.checkpoints[0].task_ids, (std::vector<TaskId>{"T1", "T3"}));

    EXPECT_EQ(f.tracker->query_status("T1").commit_ref, std::optional<std::string>("commit-1"));
    EXPECT_EQ(f.tracker->query_status("T2").status, TaskStatus::Failed);
    EXPECT_FALSE(f.tracker->query_status("T2").commit_ref.has_value());

    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].task_id, "T2");
    EXPECT_TRUE(contains(report.failures[0].reason, "agent lost its context"));
}

TEST(CoordinatorTests, Failure_FailingTestThatPassesBlocksMakePass)
{
    CoordinatorFixture f;
    ScriptedRun green;
    green.evidence = "===== 1 passed in 0.01s =====";
    f.worker->script("T1", green);

    auto report = f.run({
        make_task(1, TddPhase::FailingTest, DomainTag::Test),
        make_task(2, TddPhase::MakePass, DomainTag::Backend, TaskId("T1")),
    });

    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T1"}));
    EXPECT_EQ(report.blocked, (std::vector<TaskId>{"T2"}));
    EXPECT_EQ(f.worker->call_count("T2"), 0u);
    EXPECT_TRUE(report.checkpoints.empty());
    EXPECT_EQ(report.exit_code(), k_exit_tasks_unsettled);
    EXPECT_TRUE(contains(f.tracker->query_status("T2").reason, "predecessor T1 is failed"));
}

TEST(CoordinatorTests, Failure_BlockedAcrossGroups)
{
    CoordinatorFixture f;
    f.config.max_group_size = 1;
    ScriptedRun crash;
    crash.throws = true;
    f.worker->script("T1", crash);

    auto report = f.run({
        make_task(1, TddPhase::FailingTest, DomainTag::Test),
        make_task(2, TddPhase::MakePass, DomainTag::Backend, TaskId("T1")),
        make_task(3, TddPhase::None, DomainTag::Frontend),
    });

    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T1"}));
    EXPECT_EQ(report.blocked, (std::vector<TaskId>{"T2"}));
    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T3"}));
    ASSERT_EQ(report.checkpoints.size(), 1u);
    EXPECT_EQ(report.checkpoints[0].group_index, 2u);
}

TEST(CoordinatorTests, Failure_RollbackKeepsSiblingWorkOnSharedPath)
{
    CoordinatorFixture f;
    ScriptedRun first;
    first.touched = std::vector<std::string>{"shared.py"};
    ScriptedRun second = first;
    second.success = false;
    f.worker->script("T1", first);
    f.worker->script("T2", second);

    auto report = f.run({make_task(1, TddPhase::None, DomainTag::Backend),
                         make_task(2, TddPhase::None, DomainTag::Backend)});

    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T1"}));
    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T2"}));
    ASSERT_EQ(report.checkpoints.size(), 1u);
    EXPECT_EQ(f.workspace->committed_paths(),
              (std::vector<std::vector<std::string>>{{"shared.py"}}));
    EXPECT_EQ(f.tracker->query_status("T1").commit_ref, std::optional<std::string>("commit-1"));
}

TEST(CoordinatorTests, Failure_DeadlineExceeded)
{
    CoordinatorFixture f;
    f.config.task_timeout = std::chrono::seconds(1);
    ScriptedRun stuck;
    stuck.delay = std::chrono::milliseconds(2500);
    f.worker->script("T1", stuck);

    auto coordinator = f.coordinator();
    coordinator->set_deadline_grace(std::chrono::seconds(0));
    auto report = coordinator->run(f.plan({make_task(1), make_task(2)}));

    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T1"}));
    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T2"}));
    EXPECT_FALSE(report.aborted);
    EXPECT_TRUE(contains(f.tracker->query_status("T1").reason, "deadline of 1s"));

    // The overrunning worker has returned and its late write is gone.
    EXPECT_EQ(f.worker->finished_count(), 2);
    EXPECT_EQ(f.workspace->discards(), (std::vector<std::vector<std::string>>{{"T1.txt"}}));
    EXPECT_EQ(f.workspace->committed_paths(),
              (std::vector<std::vector<std::string>>{{"T2.txt"}}));
    EXPECT_TRUE(f.workspace->changed_paths().empty());
}

TEST(CoordinatorTests, Failure_LateWriteDoesNotLeakIntoNextGroup)
{
    CoordinatorFixture f;
    f.config.max_group_size = 2;
    f.config.task_timeout = std::chrono::seconds(1);
    ScriptedRun late;
    late.delay = std::chrono::milliseconds(1500);
    ScriptedRun slow;
    slow.delay = std::chrono::milliseconds(800);
    f.worker->script("T1", late);
    f.worker->script("T3", slow);

    auto coordinator = f.coordinator();
    coordinator->set_deadline_grace(std::chrono::seconds(0));
    auto report = coordinator->run(f.plan({
        make_task(1, TddPhase::None, DomainTag::Backend),
        make_task(2, TddPhase::None, DomainTag::Frontend),
        make_task(3, TddPhase::None, DomainTag::Database),
    }));

    EXPECT_FALSE(report.aborted);
    EXPECT_EQ(report.exit_code(), k_exit_tasks_unsettled);
    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T1"}));
    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T2", "T3"}));
    ASSERT_EQ(report.checkpoints.size(), 2u);
    EXPECT_EQ(f.workspace->committed_paths(),
              (std::vector<std::vector<std::string>>{{"T2.txt"}, {"T3.txt"}}));
}

// =============================================================================
// Checkpoint attribution
// =============================================================================

TEST(CoordinatorTests, Checkpoint_FailedTaskWithoutPathsFailsClosed)
{
    CoordinatorFixture f;
    ScriptedRun silent;
    silent.touched = std::vector<std::string>{};
    silent.unreported = {"T2.txt"};
    ScriptedRun silent_failure = silent;
    silent_failure.success = false;
    silent_failure.unreported = {"T1.txt"};
    f.worker->script("T1", silent_failure);
    f.worker->script("T2", silent);

    auto report = f.run({make_task(1, TddPhase::None, DomainTag::Backend),
                         make_task(2, TddPhase::None, DomainTag::Backend)});

    EXPECT_TRUE(report.aborted);
    EXPECT_EQ(report.exit_code(), k_exit_aborted);
    EXPECT_TRUE(contains(report.abort_reason, "failed task(s) T1 reported no paths"));
    EXPECT_TRUE(f.workspace->commit_messages().empty());
    EXPECT_EQ(f.workspace->changed_paths(), (std::vector<std::string>{"T1.txt", "T2.txt"}));
    EXPECT_FALSE(f.tracker->query_status("T2").commit_ref.has_value());
}

TEST(CoordinatorTests, Checkpoint_FailedTaskWithoutPathsNextToReportingSibling)
{
    CoordinatorFixture f;
    f.config.strict_checkpoint = false;
    ScriptedRun silent_failure;
    silent_failure.success = false;
    silent_failure.touched = std::vector<std::string>{};
    silent_failure.unreported = {"T1.txt"};
    f.worker->script("T1", silent_failure);

    auto report = f.run({make_task(1, TddPhase::None, DomainTag::Backend),
                         make_task(2, TddPhase::None, DomainTag::Backend)});

    EXPECT_EQ(report.exit_code(), k_exit_aborted);
    EXPECT_TRUE(contains(report.abort_reason, "T1.txt"));
    EXPECT_TRUE(f.workspace->commit_messages().empty());
}

TEST(CoordinatorTests, Checkpoint_CompletedTaskWithoutPathsTakesLeftovers)
{
    CoordinatorFixture f;
    ScriptedRun silent;
    silent.touched = std::vector<std::string>{};
    silent.unreported = {"T1.txt"};
    f.worker->script("T1", silent);

    auto report = f.run({make_task(1, TddPhase::None, DomainTag::Backend),
                         make_task(2, TddPhase::None, DomainTag::Backend)});

    EXPECT_EQ(report.exit_code(), k_exit_success);
    ASSERT_EQ(report.checkpoints.size(), 1u);
    EXPECT_EQ(f.workspace->committed_paths(),
              (std::vector<std::vector<std::string>>{{"T1.txt", "T2.txt"}}));
}

// =============================================================================
// Resume
// =============================================================================

TEST(CoordinatorTests, Resume_SecondRunSkipsCompleted)
{
    CoordinatorFixture f;
    auto first = f.run(reference_tasks());
    ASSERT_EQ(first.exit_code(), k_exit_success);
    const size_t calls = f.worker->calls().size();

    auto second = f.run(reference_tasks());

    EXPECT_EQ(second.exit_code(), k_exit_success);
    EXPECT_EQ(second.skipped, (std::vector<TaskId>{"T1", "T2", "T3", "T4", "T5"}));
    EXPECT_TRUE(second.completed.empty());
    EXPECT_TRUE(second.checkpoints.empty());
    EXPECT_EQ(f.worker->calls().size(), calls);
    EXPECT_EQ(f.workspace->commit_messages().size(), 2u);
}

TEST(CoordinatorTests, Resume_RetriesFailedTask)
{
    CoordinatorFixture f;
    ScriptedRun broken;
    broken.success = false;
    f.worker->script("T2", broken);
    ASSERT_EQ(f.run(independent_tasks()).failed, (std::vector<TaskId>{"T2"}));

    f.worker->script("T2", ScriptedRun{});
    auto report = f.run(independent_tasks());

    EXPECT_EQ(report.exit_code(), k_exit_success);
    EXPECT_EQ(report.skipped, (std::vector<TaskId>{"T1", "T3"}));
    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T2"}));
    ASSERT_EQ(report.checkpoints.size(), 1u);
    EXPECT_EQ(report.checkpoints[0].task_ids, (std::vector<TaskId>{"T2"}));
}

TEST(CoordinatorTests, Resume_InterruptedTaskIsRetried)
{
    CoordinatorFixture f;
    f.tracker->mark_in_progress("T1");

    auto report = f.run({make_task(1)});

    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T1"}));
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].task_id, "T1");
    EXPECT_EQ(report.failures[0].reason, "interrupted");
    EXPECT_EQ(f.tracker->query_status("T1").status, TaskStatus::Completed);
}

// =============================================================================
// Aborts
// =============================================================================

TEST(CoordinatorTests, Abort_CommitFailureStopsLaterGroups)
{
    CoordinatorFixture f;
    f.config.max_group_size = 1;
    f.workspace->set_fail_commit(true);

    auto report = f.run({
        make_task(1, TddPhase::None, DomainTag::Backend),
        make_task(2, TddPhase::None, DomainTag::Frontend),
    });

    EXPECT_TRUE(report.aborted);
    EXPECT_EQ(report.exit_code(), k_exit_aborted);
    EXPECT_TRUE(contains(report.abort_reason, "commit rejected"));
    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T1"}));
    EXPECT_EQ(report.not_run, (std::vector<TaskId>{"T2"}));
    EXPECT_EQ(f.worker->call_count("T2"), 0u);
    EXPECT_FALSE(f.tracker->query_status("T1").commit_ref.has_value());
}

TEST(CoordinatorTests, Abort_UnclaimedChangeInStrictMode)
{
    CoordinatorFixture f;
    f.workspace->touch("notes/stray.md");

    auto report = f.run({make_task(1)});

    EXPECT_EQ(report.exit_code(), k_exit_aborted);
    EXPECT_TRUE(contains(report.abort_reason, "notes/stray.md"));
    EXPECT_TRUE(f.workspace->commit_messages().empty());
}

TEST(CoordinatorTests, Abort_UnclaimedChangeAllowedWhenNotStrict)
{
    CoordinatorFixture f;
    f.config.strict_checkpoint = false;
    f.workspace->touch("notes/stray.md");

    auto report = f.run({make_task(1)});

    EXPECT_EQ(report.exit_code(), k_exit_success);
    EXPECT_EQ(report.checkpoints.size(), 1u);
    EXPECT_EQ(f.workspace->committed_paths(), (std::vector<std::vector<std::string>>{{"T1.txt"}}));
    EXPECT_EQ(f.workspace->changed_paths(), (std::vector<std::string>{"notes/stray.md"}));
}

TEST(CoordinatorTests, Abort_LockedRepository)
{
    CoordinatorFixture f;
    f.workspace->set_locked(true);

    auto report = f.run({make_task(1)});

    EXPECT_EQ(report.exit_code(), k_exit_aborted);
    EXPECT_TRUE(contains(report.abort_reason, "locked"));
}

TEST(CoordinatorTests, Abort_BrokenSuiteCheckpointsThenStops)
{
    CoordinatorFixture f;
    f.runner->set_outcome(TestOutcome::SetupError);

    auto report = f.run({
        make_task(1, TddPhase::FailingTest, DomainTag::Test),
        make_task(2, TddPhase::MakePass, DomainTag::Backend, TaskId("T1")),
        make_task(3, TddPhase::Cleanup, DomainTag::Backend, TaskId("T2")),
        make_task(4, TddPhase::None, DomainTag::Frontend),
    });

    EXPECT_EQ(report.exit_code(), k_exit_aborted);
    EXPECT_TRUE(contains(report.abort_reason, "test suite is broken (T3"));
    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T1", "T2"}));
    EXPECT_EQ(report.blocked, (std::vector<TaskId>{"T3"}));
    EXPECT_EQ(report.not_run, (std::vector<TaskId>{"T4"}));
    ASSERT_EQ(report.checkpoints.size(), 1u);
    EXPECT_EQ(report.checkpoints[0].task_ids, (std::vector<TaskId>{"T1", "T2"}));
}

TEST(CoordinatorTests, Abort_TrackerInconsistency)
{
    CoordinatorFixture f;
    f.tracker->mark_completed("T2", std::string("old-ref"), "");
    ScriptedRun green;
    green.evidence = "3 passed";
    f.worker->script("T1", green);

    auto report = f.run({
        make_task(1, TddPhase::FailingTest, DomainTag::Test),
        make_task(2, TddPhase::MakePass, DomainTag::Backend, TaskId("T1")),
        make_task(3, TddPhase::None, DomainTag::Frontend),
    });

    EXPECT_EQ(report.exit_code(), k_exit_aborted);
    EXPECT_TRUE(contains(report.abort_reason, "T2"));
    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T1"}));
    EXPECT_TRUE(report.checkpoints.empty());
    EXPECT_EQ(f.worker->call_count("T2"), 0u);
}

// =============================================================================
// Git working tree
// =============================================================================

namespace
{

/**
 * @brief Coordinator over a temporary git repository and a FileWorker.
 */
struct GitRun
{
    explicit GitRun(const tddbatch::test_support::TempRepo& repo)
        : workspace{std::make_shared<GitWorkspace>(repo.root())}
        , worker{std::make_shared<FileWorker>(repo.root())}
    {
    }

    RunReport run(const TaskList& tasks, std::chrono::seconds grace = std::chrono::seconds(10))
    {
        ExecutionCollaborators collaborators;
        collaborators.tracker = tracker;
        collaborators.worker = worker;
        collaborators.test_runner = std::make_shared<FakeTestRunner>();
        collaborators.workspace = workspace;
        ExecutionCoordinator coordinator(config, collaborators);
        coordinator.set_deadline_grace(grace);

        BatchScheduler scheduler(config.max_batch_size, config.max_group_size);
        return coordinator.run(scheduler.schedule(DependencyResolver().resolve(tasks)));
    }

    SchedulerConfig config;
    std::shared_ptr<InMemoryStatusTracker> tracker = std::make_shared<InMemoryStatusTracker>();
    std::shared_ptr<GitWorkspace> workspace;
    std::shared_ptr<FileWorker> worker;
};

} // namespace

TEST(CoordinatorTests, Git_FailedTaskKeepsSiblingLineInSharedFile)
{
    REQUIRE_GIT_REPO(repo);
    write_file(repo.file("shared.py"), "base\n");
    ASSERT_TRUE(repo.sh("git add shared.py && git commit -q -m shared"));

    GitRun git(repo);
    ScriptedRun append;
    append.touched = std::vector<std::string>{"shared.py"};
    ScriptedRun broken = append;
    broken.success = false;
    git.worker->script("T1", append);
    git.worker->script("T2", broken);

    auto report = git.run({make_task(1, TddPhase::None, DomainTag::Backend),
                           make_task(2, TddPhase::None, DomainTag::Backend)});

    EXPECT_EQ(report.completed, (std::vector<TaskId>{"T1"}));
    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T2"}));
    ASSERT_EQ(report.checkpoints.size(), 1u);
    EXPECT_EQ(read_file(repo.file("shared.py")), "base\nT1\n");
    EXPECT_EQ(repo.capture("git show HEAD:shared.py"), "base\nT1\n");
    EXPECT_TRUE(git.workspace->changed_paths().empty());
}

TEST(CoordinatorTests, Git_SilentFailureIsNeverCommitted)
{
    REQUIRE_GIT_REPO(repo);
    GitRun git(repo);
    ScriptedRun silent;
    silent.touched = std::vector<std::string>{};
    silent.unreported = {"T2.txt"};
    ScriptedRun silent_failure = silent;
    silent_failure.success = false;
    silent_failure.unreported = {"T1.txt"};
    git.worker->script("T1", silent_failure);
    git.worker->script("T2", silent);

    auto report = git.run({make_task(1, TddPhase::None, DomainTag::Backend),
                           make_task(2, TddPhase::None, DomainTag::Backend)});

    EXPECT_EQ(report.exit_code(), k_exit_aborted);
    EXPECT_TRUE(report.checkpoints.empty());
    EXPECT_EQ(repo.capture("git log --format=%s"), "initial\n");
}

TEST(CoordinatorTests, Git_TimedOutWorkerChangesRolledBack)
{
    REQUIRE_GIT_REPO(repo);
    GitRun git(repo);
    git.config.max_group_size = 2;
    git.config.task_timeout = std::chrono::seconds(1);
    ScriptedRun late;
    late.delay = std::chrono::milliseconds(1500);
    ScriptedRun slow;
    slow.delay = std::chrono::milliseconds(800);
    git.worker->script("T1", late);
    git.worker->script("T3", slow);

    auto report = git.run({make_task(1, TddPhase::None, DomainTag::Backend),
                           make_task(2, TddPhase::None, DomainTag::Frontend),
                           make_task(3, TddPhase::None, DomainTag::Database)},
                          std::chrono::seconds(0));

    EXPECT_FALSE(report.aborted) << report.abort_reason;
    EXPECT_EQ(report.failed, (std::vector<TaskId>{"T1"}));
    EXPECT_EQ(report.checkpoints.size(), 2u);
    EXPECT_FALSE(std::filesystem::exists(repo.file("T1.txt")));
    EXPECT_EQ(repo.capture("git ls-files T1.txt"), "");
    EXPECT_TRUE(git.workspace->changed_paths().empty());
}

// =============================================================================
// Pre-flight
// =============================================================================

TEST(CoordinatorTests, Preflight_DependencyErrorDispatchesNothing)
{
    CoordinatorFixture f;
    TaskParser parser;
    auto tasks = parser.parse({"T1 [P] Set up config", "T2 [GREEN] Make login pass"});

    try
    {
        f.run(tasks);
        FAIL() << "expected DependencyError";
    }
    catch (const DependencyError& e)
    {
        ASSERT_TRUE(e.diagnostics());
        EXPECT_EQ(e.diagnostics()->offending_tasks(), (std::vector<TaskId>{"T2"}));
    }
    EXPECT_TRUE(f.worker->calls().empty());
    EXPECT_TRUE(f.tracker->records().empty());
}

TEST(CoordinatorTests, Preflight_MissingWorkerRejected)
{
    CoordinatorFixture f;
    ExecutionCollaborators collaborators;
    collaborators.tracker = f.tracker;
    EXPECT_THROW(ExecutionCoordinator(f.config, collaborators), ConfigError);
}

TEST(CoordinatorTests, Preflight_InvalidConfigRejected)
{
    CoordinatorFixture f;
    f.config.max_batch_size = 0;
    EXPECT_THROW(f.coordinator(), ConfigError);
}

// =============================================================================
// Checkpoint helpers and report
// =============================================================================

TEST(CoordinatorTests, Helpers_UnclaimedPaths)
{
    EXPECT_EQ(unclaimed_paths({"src/a.py", "src/b.py", "README"}, {"src/a.py"}),
              (std::vector<std::string>{"src/b.py", "README"}));
    EXPECT_EQ(unclaimed_paths({"src/a.py", "src/sub/b.py", "srcx/c.py"}, {"src"}),
              (std::vector<std::string>{"srcx/c.py"}));
    EXPECT_TRUE(unclaimed_paths({"a", "b/c"}, {"."}).empty());
}

TEST(CoordinatorTests, Helpers_CheckpointMessage)
{
    EXPECT_EQ(checkpoint_message(3, {"T7", "T8"}), "checkpoint: group 3 (T7, T8)");
}

TEST(CoordinatorTests, Report_FormatListsOutcomes)
{
    CoordinatorFixture f;
    ScriptedRun broken;
    broken.success = false;
    f.worker->script("T2", broken);
    auto report = f.run(independent_tasks());

    const std::string text = format_report(report);
    EXPECT_TRUE(contains(text, "Run incomplete (completed=2, skipped=0, failed=1"));
    EXPECT_TRUE(contains(text, "T1, T3"));
    EXPECT_TRUE(contains(text, "checkpoint group 0 commit-1 (T1, T3)"));
    EXPECT_TRUE(contains(text, "T2: T2: worker reported failure"));
}
