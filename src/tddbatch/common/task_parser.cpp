/**
 * @file task_parser.cpp
 */
#include "tddbatch/common/task_parser.hpp"

#include <cctype>
#include <fstream>
#include <istream>

namespace tddbatch
{

namespace
{

const std::string k_unicode_arrow = "\xE2\x86\x92";

bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin]))
    {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1]))
    {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::string to_upper(const std::string& text)
{
    std::string result;
    result.reserve(text.size());
    for (char c : text)
    {
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return result;
}

/// Check `text` is `T` followed by one or more digits.
bool is_task_id(const std::string& text)
{
    if (text.size() < 2 || (text[0] != 'T' && text[0] != 't'))
    {
        return false;
    }
    return std::all_of(text.begin() + 1, text.end(), is_digit);
}

std::optional<TddPhase> phase_from_tag(const std::string& name)
{
    if (name == "RED" || name == "FAILING" || name == "FAILING-TEST")
    {
        return TddPhase::FailingTest;
    }
    if (name == "GREEN" || name == "PASS" || name == "MAKE-PASS")
    {
        return TddPhase::MakePass;
    }
    if (name == "REFACTOR" || name == "CLEANUP")
    {
        return TddPhase::Cleanup;
    }
    return std::nullopt;
}

/// Split `NAME->REF`, `NAME→REF` or `NAME:REF` into its two parts.
std::pair<std::string, std::optional<std::string>> split_tag(const std::string& tag)
{
    for (const std::string& separator : {k_unicode_arrow, std::string("->"), std::string(":")})
    {
        size_t pos = tag.find(separator);
        if (pos != std::string::npos)
        {
            return {trim(tag.substr(0, pos)), trim(tag.substr(pos + separator.size()))};
        }
    }
    return {trim(tag), std::nullopt};
}

} // namespace

TaskParser::TaskParser(DomainClassifierPtr classifier)
    : m_classifier{classifier ? std::move(classifier)
                              : std::make_shared<KeywordDomainClassifier>()}
{
}

TaskList TaskParser::parse(const std::vector<std::string>& lines) const
{
    TaskList tasks;
    std::unordered_map<TaskId, size_t> seen_lines;

    for (size_t i = 0; i < lines.size(); ++i)
    {
        const size_t line_number = i + 1;
        auto task = parse_line(lines[i], line_number);
        if (!task)
        {
            continue;
        }

        auto seen = seen_lines.find(task->id);
        if (seen != seen_lines.end())
        {
            throw ParseError(line_number, lines[i],
                             "duplicate task id " + task->id + " (first defined on line " +
                                 std::to_string(seen->second) + ")");
        }
        if (!tasks.empty() && task->number <= tasks.back().number)
        {
            throw ParseError(line_number, lines[i],
                             "task id " + task->id + " is not greater than preceding id " +
                                 tasks.back().id);
        }

        seen_lines.emplace(task->id, line_number);
        tasks.push_back(std::move(*task));
    }
    return tasks;
}

TaskList TaskParser::parse(std::istream& input) const
{
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return parse(lines);
}

TaskList TaskParser::parse_file(const std::string& path) const
{
    std::ifstream input(path);
    if (!input)
    {
        throw ParseError(0, path, "cannot open task list file");
    }
    return parse(input);
}

std::optional<Task> TaskParser::parse_line(const std::string& line, size_t line_number) const
{
    std::string rest = trim(line);
    if (rest.empty() || rest[0] == '#')
    {
        return std::nullopt;
    }

    // Optional markdown list marker and checkbox
    if (rest.size() >= 2 && (rest[0] == '-' || rest[0] == '*') && is_space(rest[1]))
    {
        rest = trim(rest.substr(2));
        if (rest.size() >= 3 && rest[0] == '[' && rest[2] == ']' &&
            (rest[1] == ' ' || rest[1] == 'x' || rest[1] == 'X'))
        {
            rest = trim(rest.substr(3));
        }
    }

    // Task id
    size_t id_end = 0;
    while (id_end < rest.size() && !is_space(rest[id_end]) && rest[id_end] != '[')
    {
        ++id_end;
    }
    std::string id = rest.substr(0, id_end);
    if (!is_task_id(id))
    {
        throw ParseError(line_number, line, "missing or malformed task id");
    }
    if (id.size() > 19)
    {
        throw ParseError(line_number, line, "task id " + id + " is too long");
    }
    id[0] = 'T';

    Task task;
    task.id = id;
    task.number = std::stoull(id.substr(1));
    task.line_number = line_number;

    // Bracketed tags
    size_t pos = id_end;
    bool has_phase_tag = false;
    while (true)
    {
        while (pos < rest.size() && is_space(rest[pos]))
        {
            ++pos;
        }
        if (pos >= rest.size() || rest[pos] != '[')
        {
            break;
        }
        size_t close = rest.find(']', pos);
        if (close == std::string::npos)
        {
            throw ParseError(line_number, line, "unterminated tag");
        }
        auto [name_raw, ref] = split_tag(rest.substr(pos + 1, close - pos - 1));
        const std::string name = to_upper(name_raw);
        pos = close + 1;

        auto phase = phase_from_tag(name);
        const bool is_depends = name == "DEPENDS" || name == "DEP" || name == "AFTER";
        if (!phase && !is_depends)
        {
            // Markers such as [P] or [US1] carry no scheduling meaning.
            continue;
        }
        if (phase)
        {
            if (has_phase_tag)
            {
                throw ParseError(line_number, line, "more than one phase tag");
            }
            has_phase_tag = true;
            task.phase = *phase;
        }
        if (is_depends && !ref)
        {
            throw ParseError(line_number, line, "dependency tag without a task id");
        }
        if (ref)
        {
            if (!is_task_id(*ref))
            {
                throw ParseError(line_number, line, "malformed predecessor reference \"" + *ref + "\"");
            }
            if (task.predecessor)
            {
                throw ParseError(line_number, line, "more than one predecessor reference");
            }
            std::string ref_id = *ref;
            ref_id[0] = 'T';
            task.predecessor = ref_id;
            task.predecessor_origin = RefOrigin::Explicit;
        }
    }

    task.description = trim(rest.substr(pos));
    if (task.description.empty())
    {
        throw ParseError(line_number, line, "task " + task.id + " has no description");
    }
    task.domain = m_classifier->classify(task.description);
    return task;
}

} // namespace tddbatch
