/**
 * @file test_runner.cpp
 */
#include "tddbatch/execution/test_runner.hpp"
#include "tddbatch/execution/process.hpp"

#include <spdlog/spdlog.h>

namespace tddbatch
{

CommandTestRunner::CommandTestRunner(std::string command,
                                     std::string working_directory,
                                     EvidenceClassifierPtr classifier,
                                     std::chrono::seconds timeout)
    : m_command{std::move(command)}
    , m_working_directory{std::move(working_directory)}
    , m_classifier{classifier ? std::move(classifier)
                              : std::make_shared<MarkerEvidenceClassifier>()}
    , m_timeout{timeout}
{
    if (m_command.empty())
    {
        throw std::invalid_argument("CommandTestRunner requires a command");
    }
}

TestEvidence CommandTestRunner::run()
{
    CommandResult result = run_command(
        "cd " + shell_quote(m_working_directory) + " && " + m_command, m_timeout);

    TestEvidence evidence = m_classifier->classify(result.output);
    if (result.timed_out)
    {
        evidence.outcome = TestOutcome::SetupError;
        evidence.summary += "\ntest command exceeded its deadline";
    }
    else if (result.exit_code == 0)
    {
        evidence.outcome = TestOutcome::Passed;
    }
    else if (evidence.outcome == TestOutcome::Passed)
    {
        evidence.outcome = TestOutcome::Unknown;
    }

    spdlog::debug("test run finished with status {} ({})",
                  result.exit_code, to_string(evidence.outcome));
    return evidence;
}

} // namespace tddbatch
