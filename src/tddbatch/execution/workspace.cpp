/**
 * @file workspace.cpp
 */
#include "tddbatch/execution/workspace.hpp"
#include "tddbatch/common/scheduler_errors.hpp"
#include "tddbatch/execution/process.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace tddbatch
{

namespace fs = std::filesystem;

namespace
{

/// Reject paths that could reach outside the working tree.
bool is_safe_relative_path(const std::string& path)
{
    fs::path p{path};
    if (path.empty() || p.is_absolute())
    {
        return false;
    }
    for (const auto& part : p)
    {
        if (part == "..")
        {
            return false;
        }
    }
    return true;
}

std::string trim_newlines(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
    {
        text.pop_back();
    }
    return text;
}

} // namespace

std::vector<std::string> parse_porcelain_z(const std::string& output)
{
    std::vector<std::string> paths;
    size_t pos = 0;
    while (pos < output.size())
    {
        size_t end = output.find('\0', pos);
        if (end == std::string::npos)
        {
            end = output.size();
        }
        const std::string entry = output.substr(pos, end - pos);
        pos = end + 1;
        if (entry.size() < 4)
        {
            continue;
        }

        const char index_status = entry[0];
        paths.push_back(entry.substr(3));

        // Renames and copies are followed by the original path.
        if ((index_status == 'R' || index_status == 'C') && pos < output.size())
        {
            size_t orig_end = output.find('\0', pos);
            if (orig_end == std::string::npos)
            {
                orig_end = output.size();
            }
            paths.push_back(output.substr(pos, orig_end - pos));
            pos = orig_end + 1;
        }
    }
    return paths;
}

GitWorkspace::GitWorkspace(std::string root, std::vector<std::string> excluded_paths)
    : m_root{std::move(root)}
    , m_excluded{std::move(excluded_paths)}
{
}

bool GitWorkspace::is_excluded(const std::string& path) const
{
    for (const auto& excluded : m_excluded)
    {
        if (path == excluded ||
            (path.size() > excluded.size() &&
             path.compare(0, excluded.size(), excluded) == 0 &&
             path[excluded.size()] == '/'))
        {
            return true;
        }
    }
    return false;
}

std::string GitWorkspace::git(const std::string& args) const
{
    return "git -C " + shell_quote(m_root) + " " + args;
}

std::string GitWorkspace::exclude_pathspecs() const
{
    std::string specs;
    for (const auto& excluded : m_excluded)
    {
        specs += " " + shell_quote(":(exclude)" + excluded);
    }
    return specs;
}

bool GitWorkspace::in_index(const std::string& path) const
{
    CommandResult listed = run_command(git("ls-files -z -- " + shell_quote(path)));
    if (!listed.ok())
    {
        throw CommitError(fmt::format("git ls-files failed for {}: {}", path, listed.output));
    }
    return !listed.output.empty();
}

std::vector<std::string> GitWorkspace::stageable(const std::vector<std::string>& paths) const
{
    std::vector<std::string> result;
    for (const auto& path : paths)
    {
        if (!is_safe_relative_path(path))
        {
            spdlog::warn("ignoring path outside the working tree: {}", path);
            continue;
        }
        if (is_excluded(path))
        {
            continue;
        }
        // git rejects a pathspec that matches neither the tree nor the index.
        std::error_code ec;
        if (fs::exists(fs::path{m_root} / path, ec) || in_index(path))
        {
            result.push_back(path);
        }
    }
    return result;
}

bool GitWorkspace::lock_file_exists() const
{
    CommandResult result = run_command(git("rev-parse --git-path index.lock"));
    if (!result.ok())
    {
        throw CommitError(fmt::format("{} is not a git working tree: {}", m_root, result.output));
    }
    fs::path lock{trim_newlines(result.output)};
    if (lock.is_relative())
    {
        lock = fs::path{m_root} / lock;
    }
    return fs::exists(lock);
}

std::vector<std::string> GitWorkspace::changed_paths()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    CommandResult result = run_command(git("status --porcelain=v1 -z --untracked-files=all"));
    if (!result.ok())
    {
        throw CommitError(fmt::format("git status failed in {}: {}", m_root, result.output));
    }
    std::vector<std::string> paths = parse_porcelain_z(result.output);
    paths.erase(std::remove_if(paths.begin(), paths.end(),
                               [this](const std::string& path) { return is_excluded(path); }),
                paths.end());
    return paths;
}

void GitWorkspace::stage(const std::vector<std::string>& paths)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::vector<std::string> accepted = stageable(paths);
    if (accepted.empty())
    {
        return;
    }

    std::string args = "add -A --";
    for (const auto& path : accepted)
    {
        args += " " + shell_quote(path);
    }
    CommandResult add = run_command(git(args + exclude_pathspecs()));
    if (!add.ok())
    {
        throw CommitError("git add failed: " + add.output);
    }
    spdlog::debug("staged {} path(s) in {}", accepted.size(), m_root);
}

void GitWorkspace::discard(const std::vector<std::string>& paths)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& path : paths)
    {
        if (!is_safe_relative_path(path))
        {
            spdlog::warn("not discarding path outside the working tree: {}", path);
            continue;
        }
        if (is_excluded(path))
        {
            continue;
        }

        if (in_index(path))
        {
            CommandResult restore = run_command(git("checkout -q -- " + shell_quote(path)));
            if (!restore.ok())
            {
                throw CommitError(fmt::format("cannot restore {}: {}", path, restore.output));
            }
        }

        // Whatever is left under the path was never accepted.
        CommandResult clean =
            run_command(git("clean -f -d -q -- " + shell_quote(path) + exclude_pathspecs()));
        if (!clean.ok())
        {
            throw CommitError(fmt::format("cannot remove {}: {}", path, clean.output));
        }
    }
}

bool GitWorkspace::is_locked()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return lock_file_exists();
}

std::string GitWorkspace::commit(const std::string& message, const std::vector<std::string>& paths)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (lock_file_exists())
    {
        throw CommitError("repository is locked by another git process (index.lock exists)");
    }

    std::vector<std::string> selected;
    for (const auto& path : paths)
    {
        if (is_safe_relative_path(path) && !is_excluded(path))
        {
            selected.push_back(path);
        }
    }
    if (selected.empty())
    {
        throw CommitError("nothing to commit: no committable paths given");
    }

    // New files must be in the index before `commit -- <paths>` can see them.
    const std::vector<std::string> to_add = stageable(selected);
    if (!to_add.empty())
    {
        std::string add_args = "add -A --";
        for (const auto& path : to_add)
        {
            add_args += " " + shell_quote(path);
        }
        CommandResult add = run_command(git(add_args));
        if (!add.ok())
        {
            throw CommitError("git add failed: " + add.output);
        }
    }

    std::string commit_args = "commit -q -m " + shell_quote(message) + " --";
    for (const auto& path : selected)
    {
        commit_args += " " + shell_quote(path);
    }
    CommandResult commit = run_command(git(commit_args));
    if (!commit.ok())
    {
        throw CommitError("git commit failed: " + commit.output);
    }
    CommandResult head = run_command(git("rev-parse HEAD"));
    if (!head.ok())
    {
        throw CommitError("cannot read new commit: " + head.output);
    }
    return trim_newlines(head.output);
}

} // namespace tddbatch
