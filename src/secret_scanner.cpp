#include "secret_scanner.hpp"
#include "compact_log.hpp"
#include <chrono>

namespace pushgate {

SecretScanner::SecretScanner(Allowlist allowlist, PathFilter filter)
    : allowlist_(std::move(allowlist)), filter_(std::move(filter)) {}

std::string SecretScanner::redact(std::string_view line, size_t offset, size_t length) {
    std::string out;
    out.reserve(line.size() + kRedacted.size());
    out.append(line.substr(0, offset));
    out.append(kRedacted);
    if (offset + length < line.size()) out.append(line.substr(offset + length));
    return out;
}

std::optional<Finding> SecretScanner::inspect(const ScanTarget& target) const {
    auto match = catalog_.match(target.line, PathFilter::is_lock_file(target.file));
    if (!match) return std::nullopt;
    if (allowlist_.allows(target.line)) {
        Log::debug("scanner", target.file + ":" + std::to_string(target.line_number) + " allowlisted");
        return std::nullopt;
    }

    Finding f;
    f.file = target.file;
    f.line_number = target.line_number;
    f.line = target.line;
    f.redacted_line = redact(target.line, match->secret_offset, match->secret_length);
    f.pattern_id = match->pattern->id;
    f.category = match->pattern->category;
    return f;
}

std::vector<Finding> SecretScanner::find_secrets(const std::vector<ScanTarget>& targets) const {
    std::vector<Finding> findings;
    for (const auto& t : targets) {
        if (filter_.is_excluded(t.file)) continue;
        if (auto f = inspect(t)) findings.push_back(std::move(*f));
    }
    return findings;
}

std::expected<std::vector<Finding>, ScanErrorInfo> SecretScanner::collect(
    const ScanOptions& options, const GitRepo& repo) const {
    std::vector<Finding> findings;
    auto sink = [&](const ScanTarget& t) {
        if (auto f = inspect(t)) findings.push_back(std::move(*f));
    };

    ContentSource source(repo, filter_);
    std::expected<size_t, SourceErrorInfo> scanned;
    if (options.diff_file) {
        scanned = source.from_diff_file(*options.diff_file, sink);
    } else if (options.mode == ScanMode::Full) {
        scanned = source.full(sink);
    } else {
        scanned = source.staged(sink);
    }
    if (!scanned) return std::unexpected(ScanErrorInfo{ScanError::Source, scanned.error().message});

    Log::debug("scanner", "inspected " + std::to_string(*scanned) + " lines");
    return findings;
}

void SecretScanner::report(const Finding& finding, bool redact) {
    std::string out = "   ";
    out += finding.file;
    out += ':';
    out += std::to_string(finding.line_number);
    out += ": [";
    out += category_name(finding.category);
    out += '/';
    out += finding.pattern_id;
    out += "] ";
    out += redact ? finding.redacted_line : finding.line;
    compact::Writer::line(out);
}

ExitStatus SecretScanner::scan(const ScanOptions& options, const GitRepo& repo) const {
    auto start = std::chrono::steady_clock::now();
    auto findings = collect(options, repo);
    if (!findings) {
        Log::error("scanner", findings.error().message);
        return ExitStatus::ValidationError;
    }

    for (const auto& f : *findings) report(f, options.redact);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    Log::debug("scanner", std::string(mode_name(options.mode)) + " scan took " + std::to_string(ms) + " ms");

    if (findings->empty()) return ExitStatus::Clean;
    compact::Writer::status(compact::Color::Red,
        "❌ " + std::to_string(findings->size()) + " potential secret(s) found");
    return ExitStatus::Violations;
}

} // namespace pushgate
