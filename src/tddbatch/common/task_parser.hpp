/**
 * @file task_parser.hpp
 * @brief TaskParser turns raw task lines into typed Task records.
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/domain_classifier.hpp"
#include "tddbatch/common/scheduler_errors.hpp"
#include "tddbatch/common/task.hpp"

#include <iosfwd>

namespace tddbatch
{

/**
 * @brief Parser for the raw ordered task list.
 *
 * @details
 * Each significant line describes one task:
 *
 * @code
 * - [ ] T001 [RED] Write failing test for order validation
 * - [ ] T002 [GREEN->T001] Implement order validation in api/orders
 * - [x] T003 [REFACTOR] Extract validation helpers
 * T004 [P] [US2] Add index on orders.created_at
 * @endcode
 *
 * - A leading `- `, `- [ ]` or `- [x]` list marker is accepted.
 * - The id is `T` followed by digits. Ids must be unique and their numbers
 *   strictly increasing.
 * - Bracketed tags follow the id. `RED`/`FAILING`, `GREEN`/`PASS` and
 *   `REFACTOR`/`CLEANUP` set the phase. A phase tag may carry a predecessor
 *   as `GREEN->T001`, `GREEN→T001` or `GREEN:T001`. `DEPENDS->T001` sets
 *   only the predecessor. Other tags (`P`, `US1`, ...) are ignored.
 * - The remaining text is the description; the domain is taken from the
 *   injected classifier.
 * - Blank lines and lines starting with `#` are skipped.
 *
 * Parsing is a pure function of the input and the classifier.
 */
class TaskParser
{
public:
    /**
     * @brief Construct a parser.
     * @param classifier Domain classifier; the keyword classifier with the
     *        default table is used when null.
     */
    explicit TaskParser(DomainClassifierPtr classifier = nullptr);

    /**
     * @brief Parse an ordered sequence of raw lines.
     * @return Tasks in input order.
     * @throws ParseError naming the first offending line.
     */
    TaskList parse(const std::vector<std::string>& lines) const;

    /**
     * @brief Parse all lines of a stream.
     * @throws ParseError naming the first offending line.
     */
    TaskList parse(std::istream& input) const;

    /**
     * @brief Parse a task list file.
     * @throws ParseError if the file cannot be read or a line is malformed.
     */
    TaskList parse_file(const std::string& path) const;

private:
    /**
     * @brief Parse one significant line.
     * @return The task, or std::nullopt for blank and comment lines.
     */
    std::optional<Task> parse_line(const std::string& line, size_t line_number) const;

    DomainClassifierPtr m_classifier;
};

} // namespace tddbatch
