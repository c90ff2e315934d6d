#pragma once

#include "config.hpp"
#include "git_repo.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <filesystem>
#include <expected>

namespace pushgate {

enum class ScanOrigin {
    Staged,
    Full
};

struct ScanTarget {
    std::string file;
    std::string line;
    size_t line_number = 0;
    ScanOrigin origin = ScanOrigin::Staged;
};

using TargetSink = std::function<void(const ScanTarget&)>;

// Source-selection rules: build output is never read, lock files are flagged
class PathFilter {
public:
    explicit PathFilter(std::vector<std::string> excluded_prefixes = default_excluded_prefixes());

    bool is_excluded(std::string_view path) const;

    static bool is_lock_file(std::string_view path);

    // Images, archives and model weights are never scanned
    static bool is_binary_extension(const std::filesystem::path& path);

private:
    std::vector<std::string> excluded_prefixes_;
};

enum class SourceError {
    Git,
    ReadFailed
};

struct SourceErrorInfo {
    SourceError error;
    std::string message;
};

// Added lines of a unified diff in order, with their post-image line numbers.
// Files deleted by the diff contribute nothing.
std::vector<ScanTarget> parse_unified_diff(std::string_view diff, ScanOrigin origin = ScanOrigin::Staged);

class ContentSource {
public:
    ContentSource(const GitRepo& repo, PathFilter filter);

    // Added lines of every staged, non-deleted, non-excluded path
    std::expected<size_t, SourceErrorInfo> staged(const TargetSink& sink) const;

    // Every line of every tracked, non-excluded, non-binary path
    std::expected<size_t, SourceErrorInfo> full(const TargetSink& sink) const;

    // Added lines of a pre-computed unified diff
    std::expected<size_t, SourceErrorInfo> from_diff_file(const std::filesystem::path& diff_path,
                                                          const TargetSink& sink) const;

    const PathFilter& filter() const { return filter_; }

private:
    const GitRepo& repo_;
    PathFilter filter_;

    static constexpr size_t kBinarySniffBytes = 8192;
};

} // namespace pushgate
