#include "installer.hpp"
#include "compact_log.hpp"
#include "string_utils.hpp"

namespace fs = std::filesystem;

namespace pushgate {

namespace {

std::unexpected<InstallErrorInfo> tx_failure(const TxErrorInfo& e) {
    return std::unexpected(InstallErrorInfo{InstallError::Transaction, e.message, e.error, e.signal});
}

} // namespace

ExitStatus exit_status_for(const InstallErrorInfo& info) {
    switch (info.error) {
        case InstallError::NotGitRepo: return ExitStatus::ValidationError;
        case InstallError::HookExists: return ExitStatus::ValidationError;
        case InstallError::Git: return exit_status_for(info.git_error);
        case InstallError::Transaction:
            switch (info.tx_error) {
                case TxError::Interrupted: return static_cast<ExitStatus>(128 + info.signal);
                case TxError::PermissionDenied: return ExitStatus::PermissionError;
                case TxError::NotActive:
                case TxError::BackupFailed:
                case TxError::WriteFailed:
                case TxError::IoError:
                    return ExitStatus::SecurityError;
            }
    }
    return ExitStatus::SecurityError;
}

Installer::Installer(GitRepo repo, GateConfig config, InstallOptions options)
    : repo_(std::move(repo)), config_(std::move(config)), options_(std::move(options)) {}

fs::path Installer::legacy_hook_path() const { return repo_.hooks_dir() / "pre-push"; }
fs::path Installer::dispatcher_path() const { return repo_.root() / kHooksDir / "pre-push"; }
fs::path Installer::chained_hook_path() const {
    return repo_.root() / kHooksDir / "pre-push.d" / "50-security-pre-push";
}

std::string Installer::config_template() {
    return "# pushgate configuration\n"
           "ENABLE_SECRET_SCAN=true\n"
           "SECRET_SCAN_MODE=staged  # staged | full\n"
           "SECRET_SCAN_EXCLUDE=target/,node_modules/,dist/,build/,vendor/,coverage/,.git/,.github/workflows/\n"
           "SECRET_ALLOWLIST_FILE=.security-controls/secret-allowlist.txt\n"
           "\n"
           "ENABLE_PIN_CHECK=true\n"
           "ENABLE_AUTOPIN=true\n"
           "WORKFLOWS_DIR=.github/workflows\n"
           "PIN_RESOLVER=api  # api | git\n"
           "RESOLVER_TIMEOUT_SECONDS=30\n"
           "\n"
           "ENABLE_LARGE_FILE_CHECK=true\n"
           "LARGE_FILE_MAX_MB=10\n"
           "\n"
           "LOG_DIR=.security-controls/logs\n";
}

std::string Installer::allowlist_template() {
    return "# One regular expression per line. A line matching any of them is never\n"
           "# reported as a secret.\n"
           "#\n"
           "# Example:\n"
           "# ^\\s*#.*test fixture\n";
}

std::string Installer::hook_script(const std::string& executable) {
    auto exe = str::shell_quote(executable);
    return "#!/bin/sh\n"
           "# pre-push security gate, installed by pushgate\n"
           "if ! command -v " + exe + " >/dev/null 2>&1; then\n"
           "  echo \"pushgate not found; push blocked\" >&2\n"
           "  exit 6\n"
           "fi\n"
           "exec " + exe + " hook\n";
}

std::string Installer::dispatcher_script() {
    return "#!/bin/sh\n"
           "# Runs every executable in pre-push.d; fails if any of them fails\n"
           "HOOK_DIR=\"$(dirname \"$0\")/pre-push.d\"\n"
           "input=$(cat)\n"
           "status=0\n"
           "if [ -d \"$HOOK_DIR\" ]; then\n"
           "  for hook in \"$HOOK_DIR\"/*; do\n"
           "    if [ -f \"$hook\" ] && [ -x \"$hook\" ]; then\n"
           "      printf '%s\\n' \"$input\" | \"$hook\" \"$@\" || status=$?\n"
           "    fi\n"
           "  done\n"
           "fi\n"
           "exit $status\n";
}

std::vector<std::string> Installer::plan() const {
    std::vector<std::string> steps;
    if (!fs::exists(repo_.root() / kConfigFile)) steps.push_back("write " + (repo_.root() / kConfigFile).string());
    auto allowlist = repo_.root() / config_.allowlist_file;
    if (!fs::exists(allowlist)) steps.push_back("write " + allowlist.string());

    if (options_.hooks_path) {
        if (!fs::exists(dispatcher_path())) steps.push_back("write dispatcher " + dispatcher_path().string());
        steps.push_back("write hook " + chained_hook_path().string());
        steps.push_back("set core.hooksPath to " + std::string(kHooksDir) + " (if unset)");
    } else {
        auto hook = legacy_hook_path();
        if (fs::exists(hook) && !options_.force) {
            steps.push_back("keep existing " + hook.string() + " (use --force to replace)");
        } else {
            steps.push_back("write hook " + hook.string());
        }
    }
    return steps;
}

std::expected<void, InstallErrorInfo> Installer::write_state_files(Transaction& tx) const {
    if (auto ok = tx.ensure_directory(repo_.root() / kStateDir); !ok) return tx_failure(ok.error());

    auto config_path = repo_.root() / kConfigFile;
    if (!fs::exists(config_path)) {
        if (auto ok = tx.atomic_write(config_path, config_template()); !ok) return tx_failure(ok.error());
        compact::Writer::line("   ✅ " + config_path.string());
    }

    auto allowlist = repo_.root() / config_.allowlist_file;
    if (!fs::exists(allowlist)) {
        if (auto ok = tx.ensure_directory(allowlist.parent_path()); !ok) return tx_failure(ok.error());
        if (auto ok = tx.atomic_write(allowlist, allowlist_template()); !ok) return tx_failure(ok.error());
        compact::Writer::line("   ✅ " + allowlist.string());
    }
    return {};
}

std::expected<void, InstallErrorInfo> Installer::install_legacy_hook(Transaction& tx) const {
    auto hook = legacy_hook_path();
    if (auto ok = tx.ensure_directory(hook.parent_path()); !ok) return tx_failure(ok.error());
    if (auto ok = tx.atomic_write(hook, hook_script(options_.executable)); !ok) return tx_failure(ok.error());
    if (auto ok = tx.set_executable(hook); !ok) return tx_failure(ok.error());
    compact::Writer::line("   ✅ " + hook.string());
    return {};
}

std::expected<void, InstallErrorInfo> Installer::install_chained_hook(Transaction& tx) const {
    auto chained = chained_hook_path();
    if (auto ok = tx.ensure_directory(chained.parent_path()); !ok) return tx_failure(ok.error());

    auto dispatcher = dispatcher_path();
    if (!fs::exists(dispatcher)) {
        if (auto ok = tx.atomic_write(dispatcher, dispatcher_script()); !ok) return tx_failure(ok.error());
        if (auto ok = tx.set_executable(dispatcher); !ok) return tx_failure(ok.error());
        compact::Writer::line("   ✅ " + dispatcher.string());
    }

    if (auto ok = tx.atomic_write(chained, hook_script(options_.executable)); !ok) return tx_failure(ok.error());
    if (auto ok = tx.set_executable(chained); !ok) return tx_failure(ok.error());
    compact::Writer::line("   ✅ " + chained.string());

    auto current = repo_.config_get("core.hooksPath");
    if (!current) return std::unexpected(InstallErrorInfo{InstallError::Git, current.error().message, TxError::IoError, 0, current.error().error});
    if (current->has_value()) {
        if (**current != kHooksDir) {
            compact::Writer::line("   ℹ️  core.hooksPath already set to " + **current + ", leaving it");
        }
        return {};
    }

    if (auto ok = tx.check_interrupted(); !ok) return tx_failure(ok.error());
    tx.add_rollback(rollback::Custom{"unset core.hooksPath", [repo = repo_] {
        return repo.config_unset("core.hooksPath").has_value();
    }});
    if (auto ok = repo_.config_set("core.hooksPath", std::string(kHooksDir)); !ok) {
        return std::unexpected(InstallErrorInfo{InstallError::Git, ok.error().message, TxError::IoError, 0, ok.error().error});
    }
    compact::Writer::line("   ✅ core.hooksPath = " + std::string(kHooksDir));
    return {};
}

std::expected<void, InstallErrorInfo> Installer::install(Transaction& tx) const {
    if (!repo_.is_git_repo()) {
        return std::unexpected(InstallErrorInfo{InstallError::NotGitRepo,
            repo_.root().string() + " is not a git repository"});
    }
    if (!options_.hooks_path && !options_.force && fs::exists(legacy_hook_path())) {
        return std::unexpected(InstallErrorInfo{InstallError::HookExists,
            legacy_hook_path().string() + " already exists (use --force or --hooks-path)"});
    }

    if (auto ok = write_state_files(tx); !ok) return ok;
    return options_.hooks_path ? install_chained_hook(tx) : install_legacy_hook(tx);
}

ExitStatus Installer::run() const {
    if (options_.dry_run) {
        compact::Writer::line("Dry run, nothing will be changed:");
        for (const auto& step : plan()) compact::Writer::line("   [DRY RUN] " + step);
        return ExitStatus::Clean;
    }

    if (auto log = Log::open_file(repo_.root() / config_.log_dir, "pushgate-install"); log) {
        Log::info("install", "logging to " + log->string());
    } else {
        Log::warn("install", log.error().message);
    }

    SignalScope signals;
    Transaction tx;
    TransactionGuard guard(tx);
    tx.begin("install");

    compact::Writer::line("Installing pre-push security gate:");
    auto result = install(tx);
    if (result) {
        if (auto ok = tx.commit(); !ok) result = tx_failure(ok.error());
    }

    if (!result) {
        Log::error("install", result.error().message);
        auto failures = tx.rollback();
        guard.dismiss();
        compact::Writer::status(compact::Color::Red, failures == 0
            ? "❌ Installation failed; all changes were rolled back"
            : "❌ Installation failed; rollback incomplete, see the log");
        Log::close_file();
        return exit_status_for(result.error());
    }

    compact::Writer::status(compact::Color::Green, "✅ Pre-push security gate installed");
    for (const auto& b : tx.backups()) compact::Writer::line("   backup kept: " + b.string());
    Log::close_file();
    return ExitStatus::Clean;
}

} // namespace pushgate
