#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <expected>

namespace pushgate {

enum class ScanMode {
    Staged,
    Full
};

enum class ResolverBackend {
    Api,
    Git
};

enum class ConfigError {
    ReadFailed,
    InvalidValue
};

struct ConfigErrorInfo {
    ConfigError error;
    std::string message;
    size_t line = 0;
};

inline const std::vector<std::string>& default_excluded_prefixes() {
    static const std::vector<std::string> prefixes = {
        "target/", "node_modules/", "dist/", "build/", "vendor/",
        "coverage/", ".git/", ".github/workflows/"
    };
    return prefixes;
}

struct GateConfig {
    bool enable_secret_scan = true;
    ScanMode secret_scan_mode = ScanMode::Staged;
    std::vector<std::string> excluded_prefixes = default_excluded_prefixes();
    std::filesystem::path allowlist_file = ".security-controls/secret-allowlist.txt";

    bool enable_pin_check = true;
    bool enable_autopin = true;
    std::filesystem::path workflows_dir = ".github/workflows";
    ResolverBackend resolver = ResolverBackend::Api;
    long resolver_timeout_seconds = 30;

    bool enable_large_file_check = true;
    size_t large_file_max_mb = 10;

    std::filesystem::path log_dir = ".security-controls/logs";
};

inline constexpr std::string_view kStateDir = ".security-controls";
inline constexpr std::string_view kConfigFile = ".security-controls/config.env";

// Applies KEY=VALUE lines on top of `base`
std::expected<GateConfig, ConfigErrorInfo> parse_config(std::string_view text, GateConfig base = {});

// A missing file yields the defaults
std::expected<GateConfig, ConfigErrorInfo> load_config(const std::filesystem::path& path);

std::string_view mode_name(ScanMode mode);
std::expected<ScanMode, ConfigErrorInfo> parse_mode(std::string_view value);

} // namespace pushgate
