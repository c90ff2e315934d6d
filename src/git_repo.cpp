#include "git_repo.hpp"
#include "compact_log.hpp"
#include "string_utils.hpp"
#include <cstdio>
#include <fstream>
#include <array>
#include <memory>
#include <sys/wait.h>

namespace pushgate {

ExitStatus exit_status_for(GitError error) {
    switch (error) {
        case GitError::ToolMissing: return ExitStatus::ToolMissing;
        case GitError::NotGitRepo:
        case GitError::CommandFailed:
            return ExitStatus::ValidationError;
    }
    return ExitStatus::ValidationError;
}

namespace {

// -z output: paths verbatim, NUL-terminated
std::vector<std::string> split_paths(const std::string& out) {
    std::vector<std::string> paths;
    size_t start = 0;
    while (start < out.size()) {
        auto end = out.find('\0', start);
        if (end == std::string::npos) end = out.size();
        if (end > start) paths.push_back(out.substr(start, end - start));
        start = end + 1;
    }
    return paths;
}

// First line of a small pointer file (".git", "commondir"), resolved against `base`
std::optional<std::filesystem::path> read_pointer(const std::filesystem::path& file,
                                                  const std::filesystem::path& base,
                                                  std::string_view prefix) {
    std::ifstream in(file);
    std::string line;
    if (!in || !std::getline(in, line)) return std::nullopt;
    auto value = str::trim(line);
    if (!value.starts_with(prefix)) return std::nullopt;
    value = str::trim(value.substr(prefix.size()));
    if (value.empty()) return std::nullopt;
    std::filesystem::path target(value);
    if (target.is_relative()) target = base / target;
    return target.lexically_normal();
}

} // namespace

GitRepo::GitRepo(std::filesystem::path repo_path)
    : repo_path_(std::move(repo_path)) {}

bool GitRepo::is_git_repo() const {
    std::error_code ec;
    return std::filesystem::exists(repo_path_ / ".git", ec);
}

std::filesystem::path GitRepo::git_dir() const {
    auto dot_git = repo_path_ / ".git";
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dot_git, ec)) return dot_git;
    if (auto target = read_pointer(dot_git, repo_path_, "gitdir:")) return *target;
    Log::warn("git", dot_git.string() + " is a file without a gitdir: line");
    return dot_git;
}

std::filesystem::path GitRepo::hooks_dir() const {
    auto dir = git_dir();
    std::error_code ec;
    if (std::filesystem::is_regular_file(dir / "commondir", ec)) {
        if (auto common = read_pointer(dir / "commondir", dir, "")) return *common / "hooks";
    }
    return dir / "hooks";
}

std::expected<std::string, GitErrorInfo> GitRepo::run_command(const std::string& cmd) {
    std::array<char, 4096> buffer;
    std::string result;

    Log::debug("git", cmd);
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) return std::unexpected(GitErrorInfo{GitError::CommandFailed, "Failed to execute git"});

    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        result.append(buffer.data(), n);
    }

    int status = pclose(pipe.release());
    if (status == -1) return std::unexpected(GitErrorInfo{GitError::CommandFailed, "Failed to wait for git"});
    if (WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        return std::unexpected(GitErrorInfo{GitError::ToolMissing, "git executable not found"});
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return std::unexpected(GitErrorInfo{GitError::CommandFailed,
            "command exited with status " + std::to_string(code) + ": " + cmd});
    }
    return result;
}

std::expected<std::string, GitErrorInfo> GitRepo::run_git_command(const std::vector<std::string>& args) const {
    std::string cmd = "git -C " + str::shell_quote(repo_path_.string());
    for (const auto& a : args) {
        cmd += ' ';
        cmd += str::shell_quote(a);
    }
    cmd += " 2>/dev/null";
    return run_command(cmd);
}

std::expected<std::vector<std::string>, GitErrorInfo> GitRepo::staged_files() const {
    if (!is_git_repo()) return std::unexpected(GitErrorInfo{GitError::NotGitRepo, "Not a git repository: " + repo_path_.string()});
    auto out = run_git_command({"diff", "--cached", "--name-only", "-z", "--diff-filter=ACM"});
    if (!out) return std::unexpected(out.error());
    return split_paths(*out);
}

std::expected<std::string, GitErrorInfo> GitRepo::staged_diff(const std::string& path) const {
    if (!is_git_repo()) return std::unexpected(GitErrorInfo{GitError::NotGitRepo, "Not a git repository: " + repo_path_.string()});
    return run_git_command({"diff", "--cached", "--no-color", "--no-ext-diff", "-U0", "--", path});
}

std::expected<std::vector<std::string>, GitErrorInfo> GitRepo::tracked_files() const {
    if (!is_git_repo()) return std::unexpected(GitErrorInfo{GitError::NotGitRepo, "Not a git repository: " + repo_path_.string()});
    auto out = run_git_command({"ls-files", "-z"});
    if (!out) return std::unexpected(out.error());
    return split_paths(*out);
}

std::expected<std::optional<std::string>, GitErrorInfo> GitRepo::config_get(const std::string& key) const {
    auto out = run_git_command({"config", "--get", key});
    if (!out) {
        // git config --get exits 1 when the key is unset
        if (out.error().error == GitError::CommandFailed) return std::optional<std::string>{};
        return std::unexpected(out.error());
    }
    return std::optional<std::string>{std::string(str::trim(*out))};
}

std::expected<void, GitErrorInfo> GitRepo::config_set(const std::string& key, const std::string& value) const {
    if (auto r = run_git_command({"config", key, value}); !r) return std::unexpected(r.error());
    return {};
}

std::expected<void, GitErrorInfo> GitRepo::config_unset(const std::string& key) const {
    if (auto r = run_git_command({"config", "--unset", key}); !r) return std::unexpected(r.error());
    return {};
}

std::expected<std::string, GitErrorInfo> GitRepo::ls_remote(
    const std::string& url, const std::vector<std::string>& patterns) {
    std::string cmd = "GIT_TERMINAL_PROMPT=0 git ls-remote " + str::shell_quote(url);
    for (const auto& p : patterns) {
        cmd += ' ';
        cmd += str::shell_quote(p);
    }
    cmd += " 2>/dev/null";
    return run_command(cmd);
}

} // namespace pushgate
