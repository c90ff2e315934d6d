#pragma once
#include "config.hpp"
#include "diff_source.hpp"
#include "exit_status.hpp"
#include "git_repo.hpp"
#include "secret_patterns.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <filesystem>

namespace pushgate {

struct Finding {
    std::string file;
    size_t line_number = 0;
    std::string line;
    std::string redacted_line;
    std::string pattern_id;
    SecretCategory category = SecretCategory::GenericAssignment;
};

struct ScanOptions {
    ScanMode mode = ScanMode::Staged;
    bool redact = false;
    std::optional<std::filesystem::path> diff_file;  // replaces the git index in staged mode
};

enum class ScanError {
    Source,
    Allowlist
};

struct ScanErrorInfo {
    ScanError error;
    std::string message;
};

class SecretScanner {
public:
    SecretScanner(Allowlist allowlist, PathFilter filter);

    // At most one Finding per line: the first catalog pattern not vetoed by the allowlist
    std::optional<Finding> inspect(const ScanTarget& target) const;

    std::vector<Finding> find_secrets(const std::vector<ScanTarget>& targets) const;

    // Pulls lines from the selected source and inspects every one of them
    std::expected<std::vector<Finding>, ScanErrorInfo> collect(const ScanOptions& options, const GitRepo& repo) const;

    // Prints every Finding and maps the run onto an exit status
    ExitStatus scan(const ScanOptions& options, const GitRepo& repo) const;

    // Replaces [offset, offset + length) with the redaction marker
    static std::string redact(std::string_view line, size_t offset, size_t length);

    static void report(const Finding& finding, bool redact);

    const PatternCatalog& catalog() const { return catalog_; }

    static constexpr std::string_view kRedacted = "***REDACTED***";

private:
    PatternCatalog catalog_;
    Allowlist allowlist_;
    PathFilter filter_;
};

} // namespace pushgate
