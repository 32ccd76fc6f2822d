/**
 * @file scheduler_config.hpp
 * @brief SchedulerConfig and its JSON loader.
 */
#pragma once
#include "tddbatch/common/batch_scheduler.hpp"
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/domain_classifier.hpp"
#include "tddbatch/common/evidence_classifier.hpp"

namespace tddbatch
{

/**
 * @brief Configuration for scheduling and execution behavior.
 *
 * @details
 * Every field has a usable default, so a config file only needs the keys it
 * changes. The JSON keys are the field names; `task_timeout` is given as
 * `task_timeout_seconds`.
 */
struct SchedulerConfig
{
    /**
     * @brief Maximum number of tasks in a Parallel batch.
     */
    size_t max_batch_size{k_default_max_batch_size};

    /**
     * @brief Maximum number of batches in a group.
     */
    size_t max_group_size{k_default_max_group_size};

    /**
     * @brief Number of dispatcher threads.
     * @details 0 means one thread per batch slot (max_group_size).
     *          1 means single-threaded execution.
     */
    size_t worker_threads{0};

    /**
     * @brief Wall-clock deadline for one task's worker invocation.
     */
    std::chrono::seconds task_timeout{std::chrono::minutes(30)};

    /**
     * @brief JSON file the status tracker persists to.
     * @details Empty means an in-memory tracker (no resume).
     */
    std::string status_file{".tddbatch/status.json"};

    /**
     * @brief JSON-lines file mirroring the failure ledger.
     * @details Empty means the ledger is kept in memory only.
     */
    std::string failure_ledger_file{".tddbatch/failures.jsonl"};

    /**
     * @brief Root of the version-controlled working tree.
     */
    std::string workspace_root{"."};

    /**
     * @brief Shell command run once per task by CommandWorker.
     */
    std::string worker_command;

    /**
     * @brief Shell command that runs the project's test suite.
     */
    std::string test_command;

    /**
     * @brief Reject checkpoints that contain changes no task claimed.
     */
    bool strict_checkpoint{true};

    /**
     * @brief Domain keyword overrides; domains not listed keep their defaults.
     */
    DomainKeywordMap domain_keywords;

    /**
     * @brief Evidence marker table.
     */
    EvidenceMarkers evidence_markers{MarkerEvidenceClassifier::default_markers()};

    /**
     * @brief Check the values are usable.
     * @throws ConfigError describing the first invalid value.
     */
    void validate() const;

    /**
     * @brief Resolve worker_threads = 0 to max_group_size.
     */
    size_t effective_worker_threads() const noexcept
    {
        return worker_threads == 0 ? max_group_size : worker_threads;
    }

    /**
     * @brief Build the keyword classifier: defaults overlaid with domain_keywords.
     */
    std::shared_ptr<KeywordDomainClassifier> make_domain_classifier() const;
};

/**
 * @brief Parse a configuration document.
 * @param json_text JSON object text.
 * @return Defaults overlaid with the document's keys.
 * @throws ConfigError on malformed JSON, wrong value types or invalid values.
 */
SchedulerConfig parse_config(const std::string& json_text);

/**
 * @brief Read and parse a configuration file.
 * @throws ConfigError if the file cannot be read or is invalid.
 */
SchedulerConfig load_config_file(const std::string& path);

} // namespace tddbatch
