#include "diff_source.hpp"
#include "compact_log.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <fstream>
#include <optional>
#include <sstream>

namespace pushgate {

namespace {

struct HunkHeader {
    size_t old_count = 1;
    size_t new_start = 0;
    size_t new_count = 1;
};

// "start[,count]"
bool parse_range(std::string_view text, size_t& start, size_t& count) {
    auto first = text.data();
    auto last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, start);
    if (ec != std::errc() || ptr == first) return false;
    count = 1;
    if (ptr != last && *ptr == ',') {
        auto [p2, ec2] = std::from_chars(ptr + 1, last, count);
        if (ec2 != std::errc() || p2 == ptr + 1) return false;
    }
    return true;
}

// "@@ -a[,b] +c[,d] @@ context"
std::optional<HunkHeader> parse_hunk_header(std::string_view line) {
    auto minus = line.find(" -");
    auto plus = line.find(" +");
    if (minus == std::string_view::npos || plus == std::string_view::npos || plus < minus) return std::nullopt;
    auto old_text = line.substr(minus + 2, plus - minus - 2);
    auto new_end = line.find(' ', plus + 2);
    auto new_text = line.substr(plus + 2, new_end == std::string_view::npos ? std::string_view::npos : new_end - plus - 2);

    HunkHeader h;
    size_t old_start = 0;
    if (!parse_range(old_text, old_start, h.old_count)) return std::nullopt;
    if (!parse_range(new_text, h.new_start, h.new_count)) return std::nullopt;
    return h;
}

// "+++ b/path" -> "path", "+++ /dev/null" -> ""
std::string post_image_path(std::string_view header) {
    auto path = str::trim(header.substr(4));
    if (path == "/dev/null") return {};
    if (path.size() >= 2 && path.front() == '"' && path.back() == '"') path = path.substr(1, path.size() - 2);
    if (path.starts_with("b/")) path.remove_prefix(2);
    return std::string(path);
}

} // namespace

PathFilter::PathFilter(std::vector<std::string> excluded_prefixes)
    : excluded_prefixes_(std::move(excluded_prefixes)) {}

bool PathFilter::is_excluded(std::string_view path) const {
    if (path.starts_with("./")) path.remove_prefix(2);
    return std::any_of(excluded_prefixes_.begin(), excluded_prefixes_.end(),
                       [&](const std::string& prefix) { return path.starts_with(prefix); });
}

bool PathFilter::is_lock_file(std::string_view path) {
    static const std::array<std::string_view, 7> names = {
        "package-lock.json", "npm-shrinkwrap.json", "pnpm-lock.yaml",
        "go.sum", "bun.lockb", "packages.lock.json", "gradle.lockfile"
    };
    auto slash = path.rfind('/');
    auto name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    if (name.ends_with(".lock")) return true;
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool PathFilter::is_binary_extension(const std::filesystem::path& path) {
    static const std::array<std::string_view, 24> extensions = {
        ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".webp", ".ico", ".pdf",
        ".zip", ".gz", ".tgz", ".xz", ".bz2", ".7z", ".jar", ".so",
        ".dylib", ".dll", ".exe", ".bin", ".dat", ".db", ".safetensors", ".pt"
    };
    auto ext = str::to_lower(path.extension().string());
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::vector<ScanTarget> parse_unified_diff(std::string_view diff, ScanOrigin origin) {
    std::vector<ScanTarget> targets;
    std::string file;
    size_t next_line = 0;
    size_t old_remaining = 0;
    size_t new_remaining = 0;

    size_t pos = 0;
    while (pos < diff.size()) {
        auto end = diff.find('\n', pos);
        if (end == std::string_view::npos) end = diff.size();
        auto line = diff.substr(pos, end - pos);
        pos = end + 1;
        if (line.ends_with('\r')) line.remove_suffix(1);

        bool in_hunk = old_remaining > 0 || new_remaining > 0;
        if (!in_hunk) {
            if (line.starts_with("diff --git ")) {
                file.clear();
            } else if (line.starts_with("+++ ")) {
                file = post_image_path(line);
            } else if (line.starts_with("@@ ")) {
                auto header = parse_hunk_header(line);
                if (!header) {
                    Log::warn("source", "malformed hunk header: " + std::string(line));
                    continue;
                }
                next_line = header->new_start;
                old_remaining = header->old_count;
                new_remaining = header->new_count;
            }
            // "--- a/path", "index ...", mode lines and "Binary files differ" carry nothing
            continue;
        }

        if (line.empty()) {
            // Some tools strip the leading space of blank context lines
            if (old_remaining > 0) --old_remaining;
            if (new_remaining > 0) --new_remaining;
            ++next_line;
            continue;
        }

        switch (line.front()) {
            case '+':
                if (!file.empty()) targets.push_back(ScanTarget{file, std::string(line.substr(1)), next_line, origin});
                ++next_line;
                if (new_remaining > 0) --new_remaining;
                break;
            case '-':
                if (old_remaining > 0) --old_remaining;
                break;
            case ' ':
                ++next_line;
                if (old_remaining > 0) --old_remaining;
                if (new_remaining > 0) --new_remaining;
                break;
            default:
                // "\ No newline at end of file"
                break;
        }
    }
    return targets;
}

ContentSource::ContentSource(const GitRepo& repo, PathFilter filter)
    : repo_(repo), filter_(std::move(filter)) {}

std::expected<size_t, SourceErrorInfo> ContentSource::staged(const TargetSink& sink) const {
    auto files = repo_.staged_files();
    if (!files) return std::unexpected(SourceErrorInfo{SourceError::Git, files.error().message});

    size_t emitted = 0;
    for (const auto& f : *files) {
        if (filter_.is_excluded(f)) {
            Log::debug("source", "excluded " + f);
            continue;
        }
        auto diff = repo_.staged_diff(f);
        if (!diff) return std::unexpected(SourceErrorInfo{SourceError::Git, diff.error().message});
        for (auto& target : parse_unified_diff(*diff, ScanOrigin::Staged)) {
            // The diff header quotes unusual names; the index path is exact
            target.file = f;
            sink(target);
            ++emitted;
        }
    }
    return emitted;
}

std::expected<size_t, SourceErrorInfo> ContentSource::full(const TargetSink& sink) const {
    auto files = repo_.tracked_files();
    if (!files) return std::unexpected(SourceErrorInfo{SourceError::Git, files.error().message});

    size_t emitted = 0;
    for (const auto& f : *files) {
        if (filter_.is_excluded(f) || PathFilter::is_binary_extension(f)) continue;

        auto path = repo_.root() / f;
        std::error_code ec;
        // Tracked but deleted in the work tree, or a submodule directory
        if (!std::filesystem::is_regular_file(path, ec)) continue;

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return std::unexpected(SourceErrorInfo{SourceError::ReadFailed, "cannot read " + path.string()});
        }
        std::ostringstream buf;
        buf << file.rdbuf();
        const std::string content = buf.str();

        auto sniff = std::string_view(content).substr(0, kBinarySniffBytes);
        if (sniff.find('\0') != std::string_view::npos) {
            Log::debug("source", "skipping binary " + f);
            continue;
        }

        size_t line_no = 0;
        size_t pos = 0;
        while (pos < content.size()) {
            auto end = content.find('\n', pos);
            if (end == std::string::npos) end = content.size();
            ++line_no;
            sink(ScanTarget{f, content.substr(pos, end - pos), line_no, ScanOrigin::Full});
            ++emitted;
            pos = end + 1;
        }
    }
    return emitted;
}

std::expected<size_t, SourceErrorInfo> ContentSource::from_diff_file(
    const std::filesystem::path& diff_path, const TargetSink& sink) const {
    std::ifstream file(diff_path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(SourceErrorInfo{SourceError::ReadFailed, "cannot read " + diff_path.string()});
    }
    std::ostringstream buf;
    buf << file.rdbuf();

    size_t emitted = 0;
    for (auto& target : parse_unified_diff(buf.str(), ScanOrigin::Staged)) {
        if (filter_.is_excluded(target.file)) continue;
        sink(target);
        ++emitted;
    }
    return emitted;
}

} // namespace pushgate
