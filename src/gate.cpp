#include "gate.hpp"
#include "hook_dispatcher.hpp"
#include "pin_validator.hpp"
#include "compact_log.hpp"

namespace fs = std::filesystem;

namespace pushgate {

Gate::Gate(GitRepo repo, GateConfig config, RefResolver* resolver)
    : repo_(std::move(repo)), config_(std::move(config)), resolver_(resolver) {}

Gate::~Gate() = default;

fs::path Gate::resolve_path(const fs::path& p) const {
    return p.is_absolute() ? p : repo_.root() / p;
}

std::expected<SecretScanner, AllowlistErrorInfo> Gate::make_scanner(
    const std::optional<fs::path>& allowlist_override) const {
    auto allowlist = Allowlist::load(resolve_path(allowlist_override.value_or(config_.allowlist_file)));
    if (!allowlist) return std::unexpected(allowlist.error());
    Log::debug("gate", std::to_string(allowlist->size()) + " allowlist rule(s)");
    return SecretScanner(std::move(*allowlist), PathFilter(config_.excluded_prefixes));
}

RefResolver& Gate::resolver() {
    if (!cache_) {
        if (!resolver_) {
            remote_ = std::make_unique<RemoteResolver>(config_.resolver, config_.resolver_timeout_seconds);
            resolver_ = remote_.get();
        }
        cache_ = std::make_unique<CachingResolver>(*resolver_);
    }
    return *cache_;
}

ExitStatus Gate::secret_scan_step() {
    auto scanner = make_scanner();
    if (!scanner) {
        Log::error("secrets", scanner.error().message);
        return ExitStatus::ConfigError;
    }
    ScanOptions options;
    options.mode = config_.secret_scan_mode;
    options.redact = true;
    return scanner->scan(options, repo_);
}

ExitStatus Gate::pin_check_step() {
    auto dir = resolve_path(config_.workflows_dir);
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        Log::info("pins", "no workflow directory at " + dir.string() + ", skipping");
        return ExitStatus::Clean;
    }

    PinValidator validator(nullptr);
    auto status = validator.check(dir);
    if (status != ExitStatus::Violations || !config_.enable_autopin) return status;

    compact::Writer::line("   Attempting to pin references automatically...");
    PinValidator pinner(&resolver());
    auto pinned = pinner.autopin(dir, AutopinOptions{});
    if (pinned == ExitStatus::Remediated) {
        // The push still carries the unpinned commit
        compact::Writer::status(compact::Color::Yellow,
            "⚠️  Workflows were rewritten; commit them and push again");
        return ExitStatus::Remediated;
    }
    return pinned == ExitStatus::Clean ? ExitStatus::Violations : pinned;
}

ExitStatus Gate::large_file_step() {
    auto files = repo_.staged_files();
    if (!files) {
        Log::error("large-files", files.error().message);
        return exit_status_for(files.error().error);
    }

    const auto limit = static_cast<std::uintmax_t>(config_.large_file_max_mb) * 1024 * 1024;
    size_t violations = 0;
    for (const auto& f : *files) {
        std::error_code ec;
        auto size = fs::file_size(repo_.root() / f, ec);
        if (ec || size <= limit) continue;
        compact::Writer::line("   " + f + ": " + std::to_string(size / (1024 * 1024)) + " MB exceeds " +
                              std::to_string(config_.large_file_max_mb) + " MB");
        ++violations;
    }
    if (violations == 0) return ExitStatus::Clean;
    compact::Writer::status(compact::Color::Red, "❌ " + std::to_string(violations) + " large file(s) staged");
    return ExitStatus::Violations;
}

ExitStatus Gate::run_hook() {
    HookDispatcher dispatcher;
    if (config_.enable_secret_scan) dispatcher.add_step("secret scan", [this] { return secret_scan_step(); });
    if (config_.enable_pin_check) dispatcher.add_step("workflow pinning", [this] { return pin_check_step(); });
    if (config_.enable_large_file_check) dispatcher.add_step("large files", [this] { return large_file_step(); });
    if (dispatcher.size() == 0) {
        Log::warn("hook", "all checks disabled in " + std::string(kConfigFile));
        return ExitStatus::Clean;
    }
    return dispatcher.run();
}

} // namespace pushgate
