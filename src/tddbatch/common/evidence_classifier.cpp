/**
 * @file evidence_classifier.cpp
 */
#include "tddbatch/common/evidence_classifier.hpp"

#include <cctype>
#include <sstream>

namespace tddbatch
{

namespace
{

const std::string k_outcome_prefix = "TDDBATCH_OUTCOME";

/// Keep evidence summaries bounded; test logs can be very large.
constexpr size_t k_max_summary_size = 4000;

std::string to_lower(const std::string& text)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text)
    {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

std::vector<std::string> lowered(std::vector<std::string> markers)
{
    for (auto& marker : markers)
    {
        marker = to_lower(marker);
    }
    markers.erase(std::remove_if(markers.begin(), markers.end(),
                                 [](const std::string& m) { return m.empty(); }),
                  markers.end());
    return markers;
}

bool any_marker(const std::string& text, const std::vector<std::string>& markers)
{
    return std::any_of(markers.begin(), markers.end(),
                       [&text](const std::string& m) { return text.find(m) != std::string::npos; });
}

std::optional<TestOutcome> explicit_outcome(const std::string& output)
{
    std::istringstream lines(output);
    std::string line;
    std::optional<TestOutcome> result;
    while (std::getline(lines, line))
    {
        if (line.compare(0, k_outcome_prefix.size(), k_outcome_prefix) != 0)
        {
            continue;
        }
        std::istringstream fields(line.substr(k_outcome_prefix.size()));
        std::string value;
        fields >> value;
        value = to_lower(value);
        if (value == "passed")
        {
            result = TestOutcome::Passed;
        }
        else if (value == "expected-failure")
        {
            result = TestOutcome::ExpectedFailure;
        }
        else if (value == "setup-error")
        {
            result = TestOutcome::SetupError;
        }
    }
    // The last declaration wins.
    return result;
}

std::string truncate(const std::string& output)
{
    if (output.size() <= k_max_summary_size)
    {
        return output;
    }
    return "..." + output.substr(output.size() - k_max_summary_size);
}

} // namespace

const char* to_string(TestOutcome outcome) noexcept
{
    switch (outcome)
    {
        case TestOutcome::Passed:
            return "passed";
        case TestOutcome::ExpectedFailure:
            return "expected-failure";
        case TestOutcome::SetupError:
            return "setup-error";
        case TestOutcome::Unknown:
            return "unknown";
    }
    return "unknown";
}

MarkerEvidenceClassifier::MarkerEvidenceClassifier()
    : MarkerEvidenceClassifier(default_markers())
{
}

MarkerEvidenceClassifier::MarkerEvidenceClassifier(EvidenceMarkers markers)
    : m_markers{lowered(std::move(markers.passed)),
                lowered(std::move(markers.expected_failure)),
                lowered(std::move(markers.setup_error))}
{
}

EvidenceMarkers MarkerEvidenceClassifier::default_markers()
{
    EvidenceMarkers markers;
    markers.passed = {"passed", "all tests passed", "tests ok", "[  passed  ]", "ok ("};
    markers.expected_failure = {
        "assertionerror", "assertion failed", "assert ", "failed", "failure",
        "cannot import name", "importerror", "nameerror", "attributeerror",
        "has no attribute", "is not defined", "undefined reference",
        "no member named", "was not declared", "not implemented"};
    markers.setup_error = {
        "modulenotfounderror", "command not found", "syntaxerror", "internalerror",
        "connection refused", "permission denied", "no tests ran", "collected 0 items",
        "segmentation fault", "fixture not found"};
    return markers;
}

TestEvidence MarkerEvidenceClassifier::classify(const std::string& output) const
{
    TestEvidence evidence;
    evidence.summary = truncate(output);

    if (auto declared = explicit_outcome(output))
    {
        evidence.outcome = *declared;
        return evidence;
    }

    const std::string text = to_lower(output);
    if (any_marker(text, m_markers.setup_error))
    {
        evidence.outcome = TestOutcome::SetupError;
    }
    else if (any_marker(text, m_markers.expected_failure))
    {
        evidence.outcome = TestOutcome::ExpectedFailure;
    }
    else if (any_marker(text, m_markers.passed))
    {
        evidence.outcome = TestOutcome::Passed;
    }
    else
    {
        evidence.outcome = TestOutcome::Unknown;
    }
    return evidence;
}

} // namespace tddbatch
