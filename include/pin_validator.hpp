#pragma once

#include "workflow_refs.hpp"
#include "ref_resolver.hpp"
#include "exit_status.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <expected>

namespace pushgate {

enum class PinError {
    DirectoryNotFound,
    ReadFailed,
    WriteFailed
};

struct PinErrorInfo {
    PinError error;
    std::string message;
};

struct PinDecision {
    WorkflowReference reference;
    std::optional<std::string> rewritten_value;
    std::string error;  // why no rewrite was produced
};

struct AutopinOptions {
    bool actions = true;
    bool images = true;
    bool quiet = false;
};

struct PinReport {
    std::vector<WorkflowReference> violations;
    size_t files_scanned = 0;
    size_t references = 0;
};

// Outcome of rewriting one file's content
struct RewriteResult {
    std::string content;
    std::vector<PinDecision> decisions;
    size_t rewritten = 0;
    size_t failed = 0;
    std::vector<WorkflowReference> skipped;  // unpinned, but of a kind not selected
};

class PinValidator {
public:
    // `resolver` is only needed for autopin
    explicit PinValidator(RefResolver* resolver = nullptr);

    // *.yml / *.yaml below `dir`, sorted
    static std::expected<std::vector<std::filesystem::path>, PinErrorInfo> workflow_files(
        const std::filesystem::path& dir);

    std::expected<PinReport, PinErrorInfo> inspect(const std::filesystem::path& dir) const;

    // 0 all pinned, 1 violations, 7 missing directory or unreadable file
    ExitStatus check(const std::filesystem::path& dir, bool quiet = false) const;

    // 2 everything rewritten, 0 nothing to do, 1 some reference left unpinned
    // (including references of a kind excluded by `options`)
    ExitStatus autopin(const std::filesystem::path& dir, const AutopinOptions& options);

    RewriteResult rewrite_content(const std::string& file, const std::string& content,
                                  const AutopinOptions& options);

    // `owner/repo[/path]@ref` -> `owner/repo@<sha> # ref`, keeping a trailing comment
    static std::string pin_action_line(const std::string& line, const WorkflowReference& ref,
                                       const std::string& sha);

    // `name[:tag]` -> `name[:tag]@sha256:...`
    static std::string pin_image_line(const std::string& line, const WorkflowReference& ref,
                                      const std::string& digest);

    static void report(const WorkflowReference& ref);

private:
    std::optional<std::string> resolve(const WorkflowReference& ref, std::string& error);

    RefResolver* resolver_;
};

} // namespace pushgate
