#include <gtest/gtest.h>
#include "tddbatch/common/scheduler_config.hpp"
#include "tddbatch/common/scheduler_errors.hpp"

using namespace tddbatch;

// ============================================================================
// Defaults
// ============================================================================

TEST(SchedulerConfigTests, Defaults_AreUsable)
{
    SchedulerConfig config;

    EXPECT_EQ(config.max_batch_size, 4u);
    EXPECT_EQ(config.max_group_size, 3u);
    EXPECT_EQ(config.task_timeout, std::chrono::seconds(1800));
    EXPECT_TRUE(config.strict_checkpoint);
    EXPECT_EQ(config.effective_worker_threads(), 3u);
    EXPECT_NO_THROW(config.validate());
}

TEST(SchedulerConfigTests, Defaults_ExplicitWorkerThreads)
{
    SchedulerConfig config;
    config.worker_threads = 1;
    EXPECT_EQ(config.effective_worker_threads(), 1u);
}

// ============================================================================
// Parsing
// ============================================================================

TEST(SchedulerConfigTests, Parse_AllScalarKeys)
{
    auto config = parse_config(R"({
        "max_batch_size": 2,
        "max_group_size": 5,
        "worker_threads": 4,
        "task_timeout_seconds": 90,
        "status_file": "state/status.json",
        "failure_ledger_file": "",
        "workspace_root": "/tmp/project",
        "worker_command": "./agent.sh",
        "test_command": "make test",
        "strict_checkpoint": false
    })");

    EXPECT_EQ(config.max_batch_size, 2u);
    EXPECT_EQ(config.max_group_size, 5u);
    EXPECT_EQ(config.worker_threads, 4u);
    EXPECT_EQ(config.task_timeout, std::chrono::seconds(90));
    EXPECT_EQ(config.status_file, "state/status.json");
    EXPECT_TRUE(config.failure_ledger_file.empty());
    EXPECT_EQ(config.workspace_root, "/tmp/project");
    EXPECT_EQ(config.worker_command, "./agent.sh");
    EXPECT_EQ(config.test_command, "make test");
    EXPECT_FALSE(config.strict_checkpoint);
}

TEST(SchedulerConfigTests, Parse_EmptyObjectKeepsDefaults)
{
    auto config = parse_config("{}");
    EXPECT_EQ(config.max_batch_size, 4u);
    EXPECT_EQ(config.status_file, ".tddbatch/status.json");
}

TEST(SchedulerConfigTests, Parse_UnknownKeyIgnored)
{
    auto config = parse_config(R"({"max_batch_size": 3, "colour": "blue"})");
    EXPECT_EQ(config.max_batch_size, 3u);
}

TEST(SchedulerConfigTests, Parse_DomainKeywords)
{
    auto config = parse_config(R"({"domain_keywords": {"backend": ["kafka", "grpc"]}})");
    auto classifier = config.make_domain_classifier();

    EXPECT_EQ(classifier->classify("Add grpc stream"), DomainTag::Backend);
    EXPECT_EQ(classifier->classify("Build settings page"), DomainTag::Frontend);
}

TEST(SchedulerConfigTests, Parse_PartialEvidenceMarkers)
{
    auto config = parse_config(R"({"evidence_markers": {"passed": ["BUILD SUCCESSFUL"]}})");

    EXPECT_EQ(config.evidence_markers.passed, (std::vector<std::string>{"BUILD SUCCESSFUL"}));
    EXPECT_EQ(config.evidence_markers.setup_error,
              MarkerEvidenceClassifier::default_markers().setup_error);
}

// ============================================================================
// Errors
// ============================================================================

TEST(SchedulerConfigTests, Error_MalformedJson)
{
    EXPECT_THROW(parse_config("{not json"), ConfigError);
}

TEST(SchedulerConfigTests, Error_NotAnObject)
{
    EXPECT_THROW(parse_config("[1, 2]"), ConfigError);
}

TEST(SchedulerConfigTests, Error_WrongType)
{
    EXPECT_THROW(parse_config(R"({"max_batch_size": "four"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"strict_checkpoint": "yes"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"domain_keywords": ["api"]})"), ConfigError);
}

TEST(SchedulerConfigTests, Error_UnknownDomain)
{
    EXPECT_THROW(parse_config(R"({"domain_keywords": {"mobile": ["ios"]}})"), ConfigError);
}

TEST(SchedulerConfigTests, Error_ZeroLimits)
{
    EXPECT_THROW(parse_config(R"({"max_batch_size": 0})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"max_group_size": 0})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"task_timeout_seconds": 0})"), ConfigError);
}

TEST(SchedulerConfigTests, Error_MissingFile)
{
    EXPECT_THROW(load_config_file("/nonexistent/tddbatch/config.json"), ConfigError);
}
