#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace pushgate {

enum class RefKind {
    Action,
    ContainerImage,
    ServiceImage
};

enum class PinStatus {
    Pinned,
    FloatingTag,
    LocalPath,
    Malformed
};

std::string_view kind_name(RefKind kind);
std::string_view status_name(PinStatus status);

// FloatingTag and Malformed block a push; Pinned and LocalPath do not
bool is_violation(PinStatus status);

struct WorkflowReference {
    std::string file;
    size_t line_number = 0;
    RefKind kind = RefKind::Action;
    std::string raw_value;
    PinStatus status = PinStatus::Malformed;
    size_t value_offset = 0;   // byte offset of raw_value inside the line
    size_t value_length = 0;
    char quote = '\0';         // quote character around the value, if any
};

bool is_hex40(std::string_view s);

// `uses:` value: ./ and .github/ are local, docker:// needs a digest,
// everything else needs a 40-hex commit after the last '@'
PinStatus classify_action(std::string_view value);

// `image:` / bare `container:` value: pinned iff it carries an @sha256: digest
PinStatus classify_image(std::string_view value);

// Line-oriented extractor for workflow files. Block membership is tracked by
// indentation alone: a `container:` or `services:` block is entered at the
// key's indentation and left at the first non-blank line indented at or
// below it. No document tree is built.
class ReferenceExtractor {
public:
    explicit ReferenceExtractor(std::string file);

    void feed(std::string_view line, size_t line_number, std::vector<WorkflowReference>& out);

    static std::vector<WorkflowReference> extract(std::string file, std::string_view content);

    bool in_container_block() const { return container_.active; }
    bool in_services_block() const { return services_.active; }

private:
    struct Block {
        bool active = false;
        size_t indent = 0;

        void enter(size_t at) { active = true; indent = at; }
        void leave_if_dedented(size_t at) {
            if (active && at <= indent) active = false;
        }
    };

    // A `key: value` line after indentation and list markers are stripped
    struct KeyLine {
        std::string_view key;
        std::string_view value;
        size_t value_offset = 0;
        char quote = '\0';
    };

    static std::optional<KeyLine> split_key(std::string_view line, size_t indent);

    void emit(const KeyLine& kl, RefKind kind, size_t line_number, std::vector<WorkflowReference>& out) const;

    std::string file_;
    Block container_;
    Block services_;
};

} // namespace pushgate
