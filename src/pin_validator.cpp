#include "pin_validator.hpp"
#include "transaction.hpp"
#include "compact_log.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace pushgate {

namespace {

std::expected<std::string, PinErrorInfo> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::unexpected(PinErrorInfo{PinError::ReadFailed, "cannot read " + path.string()});
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) return std::unexpected(PinErrorInfo{PinError::ReadFailed, "read error on " + path.string()});
    return content;
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (true) {
        auto end = content.find('\n', pos);
        if (end == std::string::npos) {
            lines.push_back(content.substr(pos));
            break;
        }
        lines.push_back(content.substr(pos, end - pos));
        pos = end + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

bool is_docker_action(const WorkflowReference& ref) {
    return ref.kind == RefKind::Action && ref.raw_value.starts_with("docker://");
}

// Docker actions are digests, so --images governs them
bool enabled(const WorkflowReference& ref, const AutopinOptions& options) {
    if (ref.kind == RefKind::Action && !is_docker_action(ref)) return options.actions;
    return options.images;
}

// Text after the value (closing quote excluded) split into a comment, if any
std::string trailing_comment(std::string_view rest) {
    auto t = str::trim(rest);
    if (t.starts_with('#')) return std::string(t);
    return {};
}

} // namespace

PinValidator::PinValidator(RefResolver* resolver) : resolver_(resolver) {}

std::expected<std::vector<fs::path>, PinErrorInfo> PinValidator::workflow_files(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return std::unexpected(PinErrorInfo{PinError::DirectoryNotFound,
            "workflow directory not found: " + dir.string()});
    }

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(dir, ec), end; it != end; it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file(ec)) continue;
        auto ext = it->path().extension();
        if (ext == ".yml" || ext == ".yaml") files.push_back(it->path());
    }
    if (ec) return std::unexpected(PinErrorInfo{PinError::ReadFailed, "cannot walk " + dir.string() + ": " + ec.message()});

    std::sort(files.begin(), files.end());
    return files;
}

std::expected<PinReport, PinErrorInfo> PinValidator::inspect(const fs::path& dir) const {
    auto files = workflow_files(dir);
    if (!files) return std::unexpected(files.error());

    PinReport report;
    for (const auto& path : *files) {
        auto content = read_file(path);
        if (!content) return std::unexpected(content.error());
        auto refs = ReferenceExtractor::extract(path.string(), *content);
        report.files_scanned++;
        report.references += refs.size();
        for (auto& ref : refs) {
            if (is_violation(ref.status)) report.violations.push_back(std::move(ref));
        }
    }
    return report;
}

void PinValidator::report(const WorkflowReference& ref) {
    std::string out = "   ";
    out += ref.file;
    out += ':';
    out += std::to_string(ref.line_number);
    out += ": [";
    out += kind_name(ref.kind);
    out += "] ";
    out += ref.raw_value.empty() ? "<empty>" : ref.raw_value;
    out += " (";
    out += status_name(ref.status);
    out += ')';
    compact::Writer::line(out);
}

ExitStatus PinValidator::check(const fs::path& dir, bool quiet) const {
    auto result = inspect(dir);
    if (!result) {
        Log::error("pincheck", result.error().message);
        return ExitStatus::ValidationError;
    }
    Log::debug("pincheck", std::to_string(result->files_scanned) + " files, " +
               std::to_string(result->references) + " references");

    if (result->violations.empty()) {
        if (!quiet) compact::Writer::status(compact::Color::Green, "✅ All workflow references are pinned");
        return ExitStatus::Clean;
    }
    if (!quiet) {
        for (const auto& ref : result->violations) report(ref);
        compact::Writer::status(compact::Color::Red,
            "❌ " + std::to_string(result->violations.size()) + " unpinned reference(s)");
    }
    return ExitStatus::Violations;
}

std::string PinValidator::pin_action_line(const std::string& line, const WorkflowReference& ref,
                                          const std::string& sha) {
    auto at = ref.raw_value.rfind('@');
    auto base = ref.raw_value.substr(0, at);
    auto tag = ref.raw_value.substr(at + 1);

    auto value_end = ref.value_offset + ref.value_length;
    std::string_view rest(line);
    rest = rest.substr(std::min(value_end, rest.size()));
    if (ref.quote != '\0' && rest.starts_with(ref.quote)) rest.remove_prefix(1);

    std::string out = line.substr(0, ref.value_offset);
    out += base;
    out += '@';
    out += sha;
    if (ref.quote != '\0') out += ref.quote;
    out += " # ";
    out += tag;
    if (auto comment = trailing_comment(rest); !comment.empty()) {
        out += ' ';
        out += comment;
    }
    return out;
}

std::string PinValidator::pin_image_line(const std::string& line, const WorkflowReference& ref,
                                         const std::string& digest) {
    auto value_end = ref.value_offset + ref.value_length;
    std::string out = line.substr(0, value_end);
    out += '@';
    out += digest;
    if (value_end < line.size()) out += line.substr(value_end);
    return out;
}

std::optional<std::string> PinValidator::resolve(const WorkflowReference& ref, std::string& error) {
    if (!resolver_) {
        error = "no resolver configured";
        return std::nullopt;
    }

    if (ref.kind == RefKind::Action && !is_docker_action(ref)) {
        auto at = ref.raw_value.rfind('@');
        auto base = ref.raw_value.substr(0, at);
        auto parts = str::split(base, '/');
        if (parts.size() < 2) {
            error = "not an owner/repo action";
            return std::nullopt;
        }
        auto sha = resolver_->resolve_commit(parts[0] + "/" + parts[1], ref.raw_value.substr(at + 1));
        if (!sha) {
            error = sha.error().message;
            return std::nullopt;
        }
        return *sha;
    }

    std::string image = ref.raw_value;
    if (image.starts_with("docker://")) image.erase(0, 9);
    auto digest = resolver_->resolve_image_digest(image);
    if (!digest) {
        error = digest.error().message;
        return std::nullopt;
    }
    return *digest;
}

RewriteResult PinValidator::rewrite_content(const std::string& file, const std::string& content,
                                            const AutopinOptions& options) {
    RewriteResult result;
    auto lines = split_lines(content);

    for (auto& ref : ReferenceExtractor::extract(file, content)) {
        if (!is_violation(ref.status)) continue;
        if (!enabled(ref, options)) {
            result.skipped.push_back(std::move(ref));
            continue;
        }

        PinDecision decision{ref, std::nullopt, {}};
        if (ref.status == PinStatus::Malformed) {
            decision.error = "malformed reference";
        } else if (auto pinned = resolve(ref, decision.error)) {
            auto& line = lines[ref.line_number - 1];
            bool cr = line.ends_with('\r');
            if (cr) line.pop_back();
            line = ref.kind == RefKind::Action && !is_docker_action(ref)
                ? pin_action_line(line, ref, *pinned)
                : pin_image_line(line, ref, *pinned);
            if (cr) line += '\r';
            decision.rewritten_value = *pinned;
        }

        if (decision.rewritten_value) result.rewritten++;
        else result.failed++;
        result.decisions.push_back(std::move(decision));
    }

    result.content = result.rewritten > 0 ? join_lines(lines) : content;
    return result;
}

ExitStatus PinValidator::autopin(const fs::path& dir, const AutopinOptions& options) {
    auto files = workflow_files(dir);
    if (!files) {
        Log::error("autopin", files.error().message);
        return ExitStatus::ValidationError;
    }

    size_t rewritten = 0;
    size_t failed = 0;
    size_t skipped = 0;
    for (const auto& path : *files) {
        auto content = read_file(path);
        if (!content) {
            Log::error("autopin", content.error().message);
            return ExitStatus::ValidationError;
        }

        auto result = rewrite_content(path.string(), *content, options);
        for (const auto& d : result.decisions) {
            if (d.rewritten_value) {
                if (!options.quiet) {
                    compact::Writer::line("   📌 " + d.reference.file + ":" + std::to_string(d.reference.line_number) +
                                          ": " + d.reference.raw_value + " -> " + *d.rewritten_value);
                }
            } else {
                if (!options.quiet) report(d.reference);
                Log::warn("autopin", d.reference.raw_value + ": " + d.error);
            }
        }

        if (result.rewritten > 0) {
            if (auto ok = write_file_atomically(path, result.content); !ok) {
                Log::error("autopin", ok.error().message);
                return ok.error().error == TxError::PermissionDenied ? ExitStatus::PermissionError
                                                                     : ExitStatus::ValidationError;
            }
        }
        for (const auto& ref : result.skipped) {
            if (!options.quiet) report(ref);
        }
        rewritten += result.rewritten;
        failed += result.failed;
        skipped += result.skipped.size();
    }

    if (failed > 0) {
        if (!options.quiet) {
            compact::Writer::status(compact::Color::Red,
                "❌ " + std::to_string(failed) + " reference(s) could not be pinned");
        }
        return ExitStatus::Violations;
    }
    if (skipped > 0) {
        if (!options.quiet) {
            if (rewritten > 0) {
                compact::Writer::status(compact::Color::Yellow,
                    "📌 Pinned " + std::to_string(rewritten) + " reference(s); review and commit the changes");
            }
            compact::Writer::status(compact::Color::Red,
                "❌ " + std::to_string(skipped) + " unpinned reference(s) of a kind not selected");
        }
        return ExitStatus::Violations;
    }
    if (rewritten > 0) {
        if (!options.quiet) {
            compact::Writer::status(compact::Color::Yellow,
                "📌 Pinned " + std::to_string(rewritten) + " reference(s); review and commit the changes");
        }
        return ExitStatus::Remediated;
    }
    if (!options.quiet) compact::Writer::status(compact::Color::Green, "✅ Nothing to pin");
    return ExitStatus::Clean;
}

} // namespace pushgate
