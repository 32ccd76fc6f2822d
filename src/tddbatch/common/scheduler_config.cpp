/**
 * @file scheduler_config.cpp
 */
#include "tddbatch/common/scheduler_config.hpp"
#include "tddbatch/common/scheduler_errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <sstream>

namespace tddbatch
{

namespace
{

using json = nlohmann::json;

const std::set<std::string> k_known_keys = {
    "max_batch_size", "max_group_size", "worker_threads", "task_timeout_seconds",
    "status_file", "failure_ledger_file", "workspace_root", "worker_command",
    "test_command", "strict_checkpoint", "domain_keywords", "evidence_markers"};

template <typename T>
void read_value(const json& doc, const char* key, T& out)
{
    auto it = doc.find(key);
    if (it == doc.end())
    {
        return;
    }
    try
    {
        out = it->get<T>();
    }
    catch (const json::exception& e)
    {
        throw ConfigError(std::string("config key \"") + key + "\": " + e.what());
    }
}

void read_markers(const json& doc, const char* key, std::vector<std::string>& out)
{
    auto it = doc.find(key);
    if (it != doc.end())
    {
        try
        {
            out = it->get<std::vector<std::string>>();
        }
        catch (const json::exception& e)
        {
            throw ConfigError(std::string("config key \"evidence_markers.") + key + "\": " + e.what());
        }
    }
}

} // namespace

void SchedulerConfig::validate() const
{
    if (max_batch_size == 0)
    {
        throw ConfigError("max_batch_size must be at least 1");
    }
    if (max_group_size == 0)
    {
        throw ConfigError("max_group_size must be at least 1");
    }
    if (task_timeout.count() <= 0)
    {
        throw ConfigError("task_timeout_seconds must be positive");
    }
    if (workspace_root.empty())
    {
        throw ConfigError("workspace_root must not be empty");
    }
}

std::shared_ptr<KeywordDomainClassifier> SchedulerConfig::make_domain_classifier() const
{
    auto classifier = std::make_shared<KeywordDomainClassifier>();
    for (const auto& [domain, keywords] : domain_keywords)
    {
        classifier->set_keywords(domain, keywords);
    }
    return classifier;
}

SchedulerConfig parse_config(const std::string& json_text)
{
    json doc;
    try
    {
        doc = json::parse(json_text);
    }
    catch (const json::parse_error& e)
    {
        throw ConfigError(std::string("invalid config JSON: ") + e.what());
    }
    if (!doc.is_object())
    {
        throw ConfigError("config document must be a JSON object");
    }

    for (const auto& item : doc.items())
    {
        if (k_known_keys.count(item.key()) == 0)
        {
            spdlog::warn("ignoring unknown config key \"{}\"", item.key());
        }
    }

    SchedulerConfig config;
    read_value(doc, "max_batch_size", config.max_batch_size);
    read_value(doc, "max_group_size", config.max_group_size);
    read_value(doc, "worker_threads", config.worker_threads);
    read_value(doc, "status_file", config.status_file);
    read_value(doc, "failure_ledger_file", config.failure_ledger_file);
    read_value(doc, "workspace_root", config.workspace_root);
    read_value(doc, "worker_command", config.worker_command);
    read_value(doc, "test_command", config.test_command);
    read_value(doc, "strict_checkpoint", config.strict_checkpoint);

    int64_t timeout_seconds = config.task_timeout.count();
    read_value(doc, "task_timeout_seconds", timeout_seconds);
    config.task_timeout = std::chrono::seconds(timeout_seconds);

    auto keywords = doc.find("domain_keywords");
    if (keywords != doc.end())
    {
        if (!keywords->is_object())
        {
            throw ConfigError("config key \"domain_keywords\" must be an object");
        }
        for (const auto& item : keywords->items())
        {
            auto domain = domain_from_string(item.key());
            if (!domain)
            {
                throw ConfigError("config key \"domain_keywords\": unknown domain \"" + item.key() + "\"");
            }
            try
            {
                config.domain_keywords[*domain] = item.value().get<std::vector<std::string>>();
            }
            catch (const json::exception& e)
            {
                throw ConfigError("config key \"domain_keywords." + item.key() + "\": " + e.what());
            }
        }
    }

    auto markers = doc.find("evidence_markers");
    if (markers != doc.end())
    {
        if (!markers->is_object())
        {
            throw ConfigError("config key \"evidence_markers\" must be an object");
        }
        read_markers(*markers, "passed", config.evidence_markers.passed);
        read_markers(*markers, "expected_failure", config.evidence_markers.expected_failure);
        read_markers(*markers, "setup_error", config.evidence_markers.setup_error);
    }

    config.validate();
    return config;
}

SchedulerConfig load_config_file(const std::string& path)
{
    std::ifstream input(path);
    if (!input)
    {
        throw ConfigError("cannot open config file " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace tddbatch
