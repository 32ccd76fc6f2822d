/**
 * @file domain_classifier.hpp
 * @brief Injectable task description -> DomainTag classification.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/task.hpp"

namespace tddbatch
{

/**
 * @brief Interface for classifying a task description into a domain.
 *
 * @details
 * Classification is heuristic and will sometimes be wrong, so it is kept
 * behind an interface: callers that know better can inject their own
 * classifier without touching parser or scheduler logic.
 */
class IDomainClassifier
{
public:
    virtual ~IDomainClassifier() = default;

    virtual DomainTag classify(const std::string& description) const = 0;
};

using DomainClassifierPtr = std::shared_ptr<const IDomainClassifier>;

/// Keyword table: domain -> keywords (lower case).
using DomainKeywordMap = std::map<DomainTag, std::vector<std::string>>;

/**
 * @brief Keyword based classifier with an overridable keyword table.
 *
 * @details
 * A keyword matches when it occurs in the lower-cased description on word
 * boundaries. A keyword that begins or ends with a non-alphanumeric
 * character (for example `.tsx` or `api/`) is matched without a boundary on
 * that side.
 *
 * @par Ambiguity
 * - No domain matched: `General`.
 * - Keywords of more than one domain matched: `General`. No priority order
 *   between domains is assumed.
 *
 * @par Thread safety
 * - `classify()` is const and safe to call concurrently.
 * - `set_keywords()` is not synchronized; configure before sharing.
 */
class KeywordDomainClassifier : public IDomainClassifier
{
public:
    /**
     * @brief Construct with the built-in keyword table.
     */
    KeywordDomainClassifier();

    /**
     * @brief Construct with a caller-provided keyword table.
     */
    explicit KeywordDomainClassifier(DomainKeywordMap keywords);

    DomainTag classify(const std::string& description) const override;

    /**
     * @brief Replace the keyword list of one domain.
     * @param domain Domain to override. `General` is accepted but never wins
     *        over an unambiguous specific domain.
     * @param keywords New keywords; matched case-insensitively.
     */
    void set_keywords(DomainTag domain, std::vector<std::string> keywords);

    const DomainKeywordMap& keywords() const noexcept
    {
        return m_keywords;
    }

    /**
     * @brief The built-in keyword table.
     */
    static DomainKeywordMap default_keywords();

private:
    static bool contains_keyword(const std::string& text, const std::string& keyword);

    DomainKeywordMap m_keywords;
};

} // namespace tddbatch
