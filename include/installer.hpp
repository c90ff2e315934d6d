#pragma once

#include "config.hpp"
#include "exit_status.hpp"
#include "git_repo.hpp"
#include "transaction.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <expected>

namespace pushgate {

struct InstallOptions {
    bool hooks_path = false;  // chain through core.hooksPath instead of .git/hooks
    bool force = false;       // replace an existing .git/hooks/pre-push
    bool dry_run = false;
    std::string executable = "pushgate";
};

enum class InstallError {
    NotGitRepo,
    HookExists,
    Transaction,
    Git
};

struct InstallErrorInfo {
    InstallError error;
    std::string message;
    TxError tx_error = TxError::IoError;
    int signal = 0;
    GitError git_error = GitError::CommandFailed;
};

class Installer {
public:
    Installer(GitRepo repo, GateConfig config, InstallOptions options);

    // Human-readable steps install() would take
    std::vector<std::string> plan() const;

    // Applies every step inside `tx`; the caller commits
    std::expected<void, InstallErrorInfo> install(Transaction& tx) const;

    // plan() for --dry-run, otherwise one guarded transaction
    ExitStatus run() const;

    std::filesystem::path legacy_hook_path() const;
    std::filesystem::path dispatcher_path() const;
    std::filesystem::path chained_hook_path() const;

    static std::string config_template();
    static std::string allowlist_template();
    static std::string hook_script(const std::string& executable);
    static std::string dispatcher_script();

    static constexpr std::string_view kHooksDir = ".githooks";

private:
    std::expected<void, InstallErrorInfo> write_state_files(Transaction& tx) const;
    std::expected<void, InstallErrorInfo> install_legacy_hook(Transaction& tx) const;
    std::expected<void, InstallErrorInfo> install_chained_hook(Transaction& tx) const;

    GitRepo repo_;
    GateConfig config_;
    InstallOptions options_;
};

ExitStatus exit_status_for(const InstallErrorInfo& info);

} // namespace pushgate
