#pragma once

#include "config.hpp"
#include "exit_status.hpp"
#include "git_repo.hpp"
#include "secret_scanner.hpp"
#include "ref_resolver.hpp"
#include <memory>
#include <optional>
#include <filesystem>
#include <expected>

namespace pushgate {

// Wires the configured checks of one repository into hook steps
class Gate {
public:
    // Without a resolver, autopin builds a RemoteResolver on first use
    Gate(GitRepo repo, GateConfig config, RefResolver* resolver = nullptr);
    ~Gate();

    const GitRepo& repo() const { return repo_; }
    const GateConfig& config() const { return config_; }

    // Relative paths are taken from the repository root
    std::filesystem::path resolve_path(const std::filesystem::path& p) const;

    std::expected<SecretScanner, AllowlistErrorInfo> make_scanner(
        const std::optional<std::filesystem::path>& allowlist_override = std::nullopt) const;

    RefResolver& resolver();

    ExitStatus secret_scan_step();
    ExitStatus pin_check_step();
    ExitStatus large_file_step();

    // Every enabled step through a HookDispatcher
    ExitStatus run_hook();

private:
    GitRepo repo_;
    GateConfig config_;
    RefResolver* resolver_;
    std::unique_ptr<RefResolver> remote_;
    std::unique_ptr<CachingResolver> cache_;
};

} // namespace pushgate
