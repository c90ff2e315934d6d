#include "config.hpp"
#include "compact_log.hpp"
#include "string_utils.hpp"
#include <charconv>
#include <fstream>
#include <sstream>

namespace pushgate {

namespace {

std::expected<bool, ConfigErrorInfo> parse_bool(std::string_view key, std::string_view value, size_t line) {
    auto v = str::to_lower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
        std::string(key) + ": expected true/false, got '" + std::string(value) + "'", line});
}

template<typename T>
std::expected<T, ConfigErrorInfo> parse_number(std::string_view key, std::string_view value, size_t line) {
    T out{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (ec != std::errc() || ptr != value.data() + value.size() || out <= 0) {
        return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
            std::string(key) + ": expected a positive number, got '" + std::string(value) + "'", line});
    }
    return out;
}

// Quoted values are taken verbatim; otherwise a " #" starts a trailing comment
std::string_view parse_value(std::string_view raw) {
    auto value = str::trim(raw);
    if (!value.empty() && (value.front() == '"' || value.front() == '\'')) {
        auto close = value.find(value.front(), 1);
        if (close != std::string_view::npos) return value.substr(1, close - 1);
    }
    if (auto hash = value.find(" #"); hash != std::string_view::npos) value = str::trim(value.substr(0, hash));
    return value;
}

} // namespace

std::string_view mode_name(ScanMode mode) {
    switch (mode) {
        case ScanMode::Staged: return "staged";
        case ScanMode::Full: return "full";
    }
    return "staged";
}

std::expected<ScanMode, ConfigErrorInfo> parse_mode(std::string_view value) {
    auto v = str::to_lower(str::trim(value));
    if (v == "staged") return ScanMode::Staged;
    if (v == "full") return ScanMode::Full;
    return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
        "scan mode must be 'staged' or 'full', got '" + std::string(value) + "'"});
}

std::expected<GateConfig, ConfigErrorInfo> parse_config(std::string_view text, GateConfig cfg) {
    size_t line_no = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        auto raw = text.substr(pos, end - pos);
        pos = end + 1;
        ++line_no;

        auto line = str::trim(raw);
        if (line.empty() || line.front() == '#') continue;
        if (line.starts_with("export ")) line = str::trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
                "expected KEY=VALUE, got '" + std::string(line) + "'", line_no});
        }
        auto key = str::trim(line.substr(0, eq));
        auto value = parse_value(line.substr(eq + 1));

        if (key == "ENABLE_SECRET_SCAN") {
            auto b = parse_bool(key, value, line_no);
            if (!b) return std::unexpected(b.error());
            cfg.enable_secret_scan = *b;
        } else if (key == "SECRET_SCAN_MODE") {
            auto m = parse_mode(value);
            if (!m) return std::unexpected(ConfigErrorInfo{m.error().error, m.error().message, line_no});
            cfg.secret_scan_mode = *m;
        } else if (key == "SECRET_SCAN_EXCLUDE") {
            cfg.excluded_prefixes = str::split(value, ',');
        } else if (key == "SECRET_ALLOWLIST_FILE") {
            cfg.allowlist_file = std::string(value);
        } else if (key == "ENABLE_PIN_CHECK") {
            auto b = parse_bool(key, value, line_no);
            if (!b) return std::unexpected(b.error());
            cfg.enable_pin_check = *b;
        } else if (key == "ENABLE_AUTOPIN") {
            auto b = parse_bool(key, value, line_no);
            if (!b) return std::unexpected(b.error());
            cfg.enable_autopin = *b;
        } else if (key == "WORKFLOWS_DIR") {
            cfg.workflows_dir = std::string(value);
        } else if (key == "PIN_RESOLVER") {
            auto v = str::to_lower(value);
            if (v == "api") cfg.resolver = ResolverBackend::Api;
            else if (v == "git") cfg.resolver = ResolverBackend::Git;
            else return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue,
                "PIN_RESOLVER must be 'api' or 'git', got '" + std::string(value) + "'", line_no});
        } else if (key == "RESOLVER_TIMEOUT_SECONDS") {
            auto n = parse_number<long>(key, value, line_no);
            if (!n) return std::unexpected(n.error());
            cfg.resolver_timeout_seconds = *n;
        } else if (key == "ENABLE_LARGE_FILE_CHECK") {
            auto b = parse_bool(key, value, line_no);
            if (!b) return std::unexpected(b.error());
            cfg.enable_large_file_check = *b;
        } else if (key == "LARGE_FILE_MAX_MB") {
            auto n = parse_number<size_t>(key, value, line_no);
            if (!n) return std::unexpected(n.error());
            cfg.large_file_max_mb = *n;
        } else if (key == "LOG_DIR") {
            cfg.log_dir = std::string(value);
        } else {
            // Toggles for checks run by other hooks
            Log::debug("config", "ignoring unknown key " + std::string(key));
        }
    }
    return cfg;
}

std::expected<GateConfig, ConfigErrorInfo> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return GateConfig{};

    std::ifstream file(path);
    if (!file) {
        return std::unexpected(ConfigErrorInfo{ConfigError::ReadFailed, "cannot read " + path.string()});
    }
    std::ostringstream content;
    content << file.rdbuf();

    auto cfg = parse_config(content.str());
    if (!cfg) {
        auto err = cfg.error();
        err.message = path.string() + ":" + std::to_string(err.line) + ": " + err.message;
        return std::unexpected(err);
    }
    return cfg;
}

} // namespace pushgate
