#pragma once
#include "exit_status.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <expected>
#include <optional>

namespace pushgate {

enum class GitError {
    NotGitRepo,
    CommandFailed,
    ToolMissing
};

struct GitErrorInfo {
    GitError error;
    std::string message;
};

ExitStatus exit_status_for(GitError error);

// Thin wrapper over the git CLI for one working tree
class GitRepo {
public:
    explicit GitRepo(std::filesystem::path repo_path);

    bool is_git_repo() const;
    const std::filesystem::path& root() const { return repo_path_; }
    // Follows a `gitdir:` file (linked worktree, submodule)
    std::filesystem::path git_dir() const;

    // Hooks live in the common directory shared by all worktrees
    std::filesystem::path hooks_dir() const;

    // Added, copied or modified paths in the index (deletions excluded)
    std::expected<std::vector<std::string>, GitErrorInfo> staged_files() const;

    // Zero-context staged diff of one path
    std::expected<std::string, GitErrorInfo> staged_diff(const std::string& path) const;

    std::expected<std::vector<std::string>, GitErrorInfo> tracked_files() const;

    std::expected<std::optional<std::string>, GitErrorInfo> config_get(const std::string& key) const;
    std::expected<void, GitErrorInfo> config_set(const std::string& key, const std::string& value) const;
    std::expected<void, GitErrorInfo> config_unset(const std::string& key) const;

    // `git ls-remote <url> <patterns...>` output, runnable outside a work tree
    static std::expected<std::string, GitErrorInfo> ls_remote(
        const std::string& url, const std::vector<std::string>& patterns);

private:
    std::filesystem::path repo_path_;

    std::expected<std::string, GitErrorInfo> run_git_command(const std::vector<std::string>& args) const;
    static std::expected<std::string, GitErrorInfo> run_command(const std::string& cmd);
};

} // namespace pushgate
