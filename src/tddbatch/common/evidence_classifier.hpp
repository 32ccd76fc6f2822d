/**
 * @file evidence_classifier.hpp
 * @brief Classification of free-form test-run output.
 */
#pragma once
#include "tddbatch/common/common.hpp"

namespace tddbatch
{

/**
 * @brief What a test run says about the code under test.
 */
enum class TestOutcome
{
    Passed,           ///< The relevant tests ran and passed.
    ExpectedFailure,  ///< Tests ran and failed on an assertion or missing symbol.
    SetupError,       ///< The run failed for an unrelated reason (environment, syntax, collection).
    Unknown           ///< Nothing recognizable in the output.
};

const char* to_string(TestOutcome outcome) noexcept;

/**
 * @brief Classified test-run output.
 */
struct TestEvidence
{
    TestOutcome outcome{TestOutcome::Unknown};

    /// Raw output (possibly truncated) the outcome was derived from.
    std::string summary;

    bool passed() const noexcept
    {
        return outcome == TestOutcome::Passed;
    }
};

/**
 * @brief Marker table used by MarkerEvidenceClassifier.
 *
 * @details
 * Markers are matched case-insensitively as substrings.
 */
struct EvidenceMarkers
{
    std::vector<std::string> passed;
    std::vector<std::string> expected_failure;
    std::vector<std::string> setup_error;
};

/**
 * @brief Interface for turning test output into a TestEvidence.
 */
class IEvidenceClassifier
{
public:
    virtual ~IEvidenceClassifier() = default;

    virtual TestEvidence classify(const std::string& output) const = 0;
};

using EvidenceClassifierPtr = std::shared_ptr<const IEvidenceClassifier>;

/**
 * @brief Marker based classifier.
 *
 * @details
 * Precedence, first match wins:
 * 1. An explicit `TDDBATCH_OUTCOME <passed|expected-failure|setup-error>`
 *    line written by the worker or test command.
 * 2. Any setup-error marker.
 * 3. Any expected-failure marker.
 * 4. Any passed marker.
 * 5. Otherwise Unknown.
 *
 * Failure markers are checked before pass markers because summaries such as
 * "1 failed, 12 passed" contain both.
 */
class MarkerEvidenceClassifier : public IEvidenceClassifier
{
public:
    MarkerEvidenceClassifier();
    explicit MarkerEvidenceClassifier(EvidenceMarkers markers);

    TestEvidence classify(const std::string& output) const override;

    const EvidenceMarkers& markers() const noexcept
    {
        return m_markers;
    }

    static EvidenceMarkers default_markers();

private:
    EvidenceMarkers m_markers;
};

} // namespace tddbatch
