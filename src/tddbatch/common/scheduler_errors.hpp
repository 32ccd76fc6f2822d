/**
 * @file scheduler_errors.hpp
 */
#pragma once
#include "tddbatch/common/common.hpp"
#include "tddbatch/common/dependency_diagnostics.hpp"
#include "tddbatch/common/task.hpp"

namespace tddbatch
{

/**
 * @brief Error codes for scheduler operations.
 *
 * @details
 * Pre-flight codes (`Parse`, `Dependency`, `Config`) abort before any task is
 * dispatched. `Commit` and `TrackerInconsistency` abort a run in progress.
 * `Execution` is isolated to a single task and never stops the run.
 */
enum class SchedulerErrorCode
{
    Parse,
    Dependency,
    Config,
    Execution,
    Commit,
    TrackerInconsistency
};

/**
 * @brief Base exception class for scheduler errors.
 *
 * @details
 * Each exception carries an error code and a descriptive message. Derived
 * classes add the context specific to their stage.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class SchedulerError : public std::exception
{
public:
    SchedulerError(SchedulerErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    SchedulerErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

    /**
     * @brief Whether this error aborts the whole run.
     */
    bool is_fatal() const noexcept
    {
        return m_code != SchedulerErrorCode::Execution;
    }

private:
    SchedulerErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Thrown by TaskParser for a malformed task line.
 */
class ParseError : public SchedulerError
{
public:
    ParseError(size_t line_number, std::string line_text, const std::string& message)
        : SchedulerError(SchedulerErrorCode::Parse,
                         "line " + std::to_string(line_number) + ": " + message +
                             " (\"" + line_text + "\")")
        , m_line_number(line_number)
        , m_line_text(std::move(line_text))
    {
    }

    size_t line_number() const noexcept
    {
        return m_line_number;
    }

    const std::string& line_text() const noexcept
    {
        return m_line_text;
    }

private:
    size_t m_line_number;
    std::string m_line_text;
};

/**
 * @brief Thrown when phase chain validation fails.
 */
class DependencyError : public SchedulerError
{
public:
    DependencyError(const std::string& message,
                    std::shared_ptr<DependencyDiagnostics> diagnostics)
        : SchedulerError(SchedulerErrorCode::Dependency, message)
        , m_diagnostics(std::move(diagnostics))
    {
    }

    /**
     * @brief Get the diagnostics that caused the validation failure.
     */
    const std::shared_ptr<DependencyDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<DependencyDiagnostics> m_diagnostics;
};

/**
 * @brief Thrown for invalid configuration values or files.
 */
class ConfigError : public SchedulerError
{
public:
    explicit ConfigError(const std::string& message)
        : SchedulerError(SchedulerErrorCode::Config, message)
    {
    }
};

/**
 * @brief Failure of a single task's execution (worker, timeout, guard).
 */
class ExecutionError : public SchedulerError
{
public:
    ExecutionError(TaskId task_id, const std::string& message)
        : SchedulerError(SchedulerErrorCode::Execution, task_id + ": " + message)
        , m_task_id(std::move(task_id))
    {
    }

    const TaskId& task_id() const noexcept
    {
        return m_task_id;
    }

private:
    TaskId m_task_id;
};

/**
 * @brief Checkpoint could not be committed; requires manual resolution.
 */
class CommitError : public SchedulerError
{
public:
    explicit CommitError(const std::string& message)
        : SchedulerError(SchedulerErrorCode::Commit, message)
    {
    }
};

/**
 * @brief StatusTracker reported a state the coordinator did not expect.
 */
class TrackerInconsistencyError : public SchedulerError
{
public:
    TrackerInconsistencyError(TaskId task_id, const std::string& message)
        : SchedulerError(SchedulerErrorCode::TrackerInconsistency, task_id + ": " + message)
        , m_task_id(std::move(task_id))
    {
    }

    const TaskId& task_id() const noexcept
    {
        return m_task_id;
    }

private:
    TaskId m_task_id;
};

} // namespace tddbatch
