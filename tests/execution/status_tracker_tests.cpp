#include <gtest/gtest.h>
#include "tddbatch/common/scheduler_errors.hpp"
#include "tddbatch/execution/status_tracker.hpp"
#include "test_fakes.hpp"

using namespace tddbatch;
using tddbatch::test_support::ScopedTempDir;
using tddbatch::test_support::read_file;
using tddbatch::test_support::write_file;

// =============================================================================
// InMemoryStatusTracker
// =============================================================================

TEST(StatusTrackerTests, InMemory_UnknownTaskIsPending)
{
    InMemoryStatusTracker tracker;
    auto record = tracker.query_status("T7");

    EXPECT_EQ(record.task_id, "T7");
    EXPECT_EQ(record.status, TaskStatus::Pending);
    EXPECT_FALSE(record.commit_ref.has_value());
    EXPECT_TRUE(tracker.records().empty());
}

TEST(StatusTrackerTests, InMemory_Lifecycle)
{
    InMemoryStatusTracker tracker;

    tracker.mark_in_progress("T1");
    EXPECT_EQ(tracker.query_status("T1").status, TaskStatus::InProgress);

    tracker.mark_completed("T1", std::nullopt, "3 passed");
    auto record = tracker.query_status("T1");
    EXPECT_EQ(record.status, TaskStatus::Completed);
    EXPECT_EQ(record.evidence, "3 passed");
    EXPECT_FALSE(record.commit_ref.has_value());

    tracker.mark_completed("T1", std::string("abc123"), "");
    record = tracker.query_status("T1");
    EXPECT_EQ(record.commit_ref, std::optional<std::string>("abc123"));
    EXPECT_EQ(record.evidence, "3 passed");
}

TEST(StatusTrackerTests, InMemory_MissingRefKeepsKnownRef)
{
    InMemoryStatusTracker tracker;
    tracker.mark_completed("T1", std::string("abc123"), "ok");
    tracker.mark_completed("T1", std::nullopt, "");

    EXPECT_EQ(tracker.query_status("T1").commit_ref, std::optional<std::string>("abc123"));
}

TEST(StatusTrackerTests, InMemory_FailedAndBlockedKeepReason)
{
    InMemoryStatusTracker tracker;
    tracker.mark_completed("T1", std::string("abc"), "");
    tracker.mark_failed("T1", "worker crashed");
    tracker.mark_blocked("T2", "predecessor T1 is failed, not completed");

    auto failed = tracker.query_status("T1");
    EXPECT_EQ(failed.status, TaskStatus::Failed);
    EXPECT_EQ(failed.reason, "worker crashed");
    EXPECT_FALSE(failed.commit_ref.has_value());

    auto blocked = tracker.query_status("T2");
    EXPECT_EQ(blocked.status, TaskStatus::Blocked);
    EXPECT_EQ(blocked.reason, "predecessor T1 is failed, not completed");
}

TEST(StatusTrackerTests, InMemory_RecordsInFirstSeenOrder)
{
    InMemoryStatusTracker tracker;
    tracker.mark_in_progress("T3");
    tracker.mark_in_progress("T1");
    tracker.mark_completed("T3", std::nullopt, "");
    tracker.mark_blocked("T2", "x");

    auto records = tracker.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].task_id, "T3");
    EXPECT_EQ(records[1].task_id, "T1");
    EXPECT_EQ(records[2].task_id, "T2");
}

TEST(StatusTrackerTests, InMemory_Checkpoints)
{
    InMemoryStatusTracker tracker;
    Checkpoint cp;
    cp.group_index = 2;
    cp.commit_ref = "deadbeef";
    cp.task_ids = {"T4", "T5"};
    tracker.record_checkpoint(cp);

    auto checkpoints = tracker.checkpoints();
    ASSERT_EQ(checkpoints.size(), 1u);
    EXPECT_EQ(checkpoints[0].group_index, 2u);
    EXPECT_EQ(checkpoints[0].task_ids, (std::vector<TaskId>{"T4", "T5"}));
}

// =============================================================================
// JsonFileStatusTracker
// =============================================================================

TEST(StatusTrackerTests, JsonFile_MissingFileStartsEmpty)
{
    ScopedTempDir dir;
    JsonFileStatusTracker tracker(dir.file("status.json"));

    EXPECT_TRUE(tracker.records().empty());
    EXPECT_FALSE(std::filesystem::exists(dir.file("status.json")));
}

TEST(StatusTrackerTests, JsonFile_SurvivesRestart)
{
    ScopedTempDir dir;
    const std::string path = dir.file("state/status.json");
    {
        JsonFileStatusTracker tracker(path);
        tracker.mark_completed("T1", std::string("c0ffee"), "3 passed");
        tracker.mark_failed("T2", "assertion evidence missing");
        tracker.mark_in_progress("T3");
        Checkpoint cp;
        cp.group_index = 0;
        cp.commit_ref = "c0ffee";
        cp.task_ids = {"T1"};
        tracker.record_checkpoint(cp);
    }

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    JsonFileStatusTracker reloaded(path);
    auto t1 = reloaded.query_status("T1");
    EXPECT_EQ(t1.status, TaskStatus::Completed);
    EXPECT_EQ(t1.commit_ref, std::optional<std::string>("c0ffee"));
    EXPECT_EQ(t1.evidence, "3 passed");

    auto t2 = reloaded.query_status("T2");
    EXPECT_EQ(t2.status, TaskStatus::Failed);
    EXPECT_EQ(t2.reason, "assertion evidence missing");

    EXPECT_EQ(reloaded.query_status("T3").status, TaskStatus::InProgress);

    auto records = reloaded.records();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[2].task_id, "T3");

    auto checkpoints = reloaded.checkpoints();
    ASSERT_EQ(checkpoints.size(), 1u);
    EXPECT_EQ(checkpoints[0].commit_ref, "c0ffee");
    EXPECT_EQ(checkpoints[0].task_ids, (std::vector<TaskId>{"T1"}));
}

TEST(StatusTrackerTests, JsonFile_DocumentLayout)
{
    ScopedTempDir dir;
    const std::string path = dir.file("status.json");
    JsonFileStatusTracker tracker(path);
    tracker.mark_completed("T1", std::nullopt, "");

    const std::string text = read_file(path);
    EXPECT_NE(text.find("\"version\": 1"), std::string::npos);
    EXPECT_NE(text.find("\"status\": \"completed\""), std::string::npos);
    EXPECT_NE(text.find("\"commit_ref\": null"), std::string::npos);
}

TEST(StatusTrackerTests, JsonFile_CorruptFileRejected)
{
    ScopedTempDir dir;
    const std::string path = dir.file("status.json");
    write_file(path, "{\"records\": [ {\"task_id\": ");

    EXPECT_THROW(JsonFileStatusTracker tracker(path), ConfigError);
}

TEST(StatusTrackerTests, JsonFile_UnknownStatusRejected)
{
    ScopedTempDir dir;
    const std::string path = dir.file("status.json");
    write_file(path, R"({"version": 1, "records": [{"task_id": "T1", "status": "done"}]})");

    EXPECT_THROW(JsonFileStatusTracker tracker(path), ConfigError);
}
