/**
 * @file workspace.hpp
 * @brief IWorkspace interface and the git-backed workspace.
 */
#pragma once
#include "tddbatch/common/common.hpp"

namespace tddbatch
{

/**
 * @brief The shared version-controlled working tree.
 *
 * @details
 * A path moves through three states: committed, accepted and changed. A task
 * that completes has its paths accepted with `stage()`. Rolling back a task
 * with `discard()` returns its paths to the accepted state, so the content a
 * completed sibling left in the same path survives. Only the checkpoint step
 * commits, and it does so under the coordinator's commit mutex.
 *
 * @par Thread Safety
 * - Methods are called from several dispatcher threads; implementations
 *   serialize them.
 */
class IWorkspace
{
public:
    virtual ~IWorkspace() = default;

    /**
     * @brief Paths that differ from the last commit, including untracked
     *        files and accepted changes.
     */
    virtual std::vector<std::string> changed_paths() = 0;

    /**
     * @brief Accept the current content of the given paths.
     * @details A later discard() of these paths restores this content.
     * @throws CommitError if the paths cannot be recorded.
     */
    virtual void stage(const std::vector<std::string>& paths) = 0;

    /**
     * @brief Restore the given paths to their accepted state.
     * @details Paths never accepted return to the last commit; paths absent
     *          there are removed.
     * @throws CommitError if the tree cannot be restored.
     */
    virtual void discard(const std::vector<std::string>& paths) = 0;

    /**
     * @brief Whether another process currently holds the repository lock.
     */
    virtual bool is_locked() = 0;

    /**
     * @brief Commit the current content of exactly the given paths.
     * @details Other changes in the tree stay uncommitted.
     * @return The new commit's ref.
     * @throws CommitError if the commit cannot be made.
     */
    virtual std::string commit(const std::string& message,
                               const std::vector<std::string>& paths) = 0;
};

using WorkspacePtr = std::shared_ptr<IWorkspace>;

/**
 * @brief IWorkspace implemented with the `git` command line.
 *
 * @details
 * The accepted state is the git index. Excluded paths (the scheduler's own
 * status and ledger files) are never reported as changes, never staged and
 * never removed. An excluded entry matches the path itself and everything
 * below it.
 */
class GitWorkspace : public IWorkspace
{
public:
    explicit GitWorkspace(std::string root, std::vector<std::string> excluded_paths = {});

    std::vector<std::string> changed_paths() override;
    void stage(const std::vector<std::string>& paths) override;
    void discard(const std::vector<std::string>& paths) override;
    bool is_locked() override;
    std::string commit(const std::string& message,
                       const std::vector<std::string>& paths) override;

    const std::string& root() const noexcept
    {
        return m_root;
    }

    bool is_excluded(const std::string& path) const;

private:
    std::string git(const std::string& args) const;

    /// `:(exclude)` pathspecs for the excluded paths, each with a leading space.
    std::string exclude_pathspecs() const;

    bool in_index(const std::string& path) const;

    /// Safe, non-excluded paths that exist in the tree or in the index.
    std::vector<std::string> stageable(const std::vector<std::string>& paths) const;

    bool lock_file_exists() const;

    std::string m_root;
    std::vector<std::string> m_excluded;
    std::mutex m_mutex;
};

/**
 * @brief Parse `git status --porcelain=v1 -z` output into paths.
 * @details For renames both the new and the original path are returned.
 */
std::vector<std::string> parse_porcelain_z(const std::string& output);

} // namespace tddbatch
