#include "workflow_refs.hpp"
#include "string_utils.hpp"
#include <cctype>

namespace pushgate {

std::string_view kind_name(RefKind kind) {
    switch (kind) {
        case RefKind::Action: return "action";
        case RefKind::ContainerImage: return "container image";
        case RefKind::ServiceImage: return "service image";
    }
    return "reference";
}

std::string_view status_name(PinStatus status) {
    switch (status) {
        case PinStatus::Pinned: return "pinned";
        case PinStatus::FloatingTag: return "floating tag";
        case PinStatus::LocalPath: return "local path";
        case PinStatus::Malformed: return "malformed";
    }
    return "unknown";
}

bool is_violation(PinStatus status) {
    switch (status) {
        case PinStatus::Pinned:
        case PinStatus::LocalPath:
            return false;
        case PinStatus::FloatingTag:
        case PinStatus::Malformed:
            return true;
    }
    return true;
}

bool is_hex40(std::string_view s) {
    return s.size() == 40 && str::is_hex(s);
}

PinStatus classify_action(std::string_view value) {
    if (value.empty() || value.find("${{") != std::string_view::npos) return PinStatus::Malformed;
    if (value.starts_with("./") || value.starts_with(".github/")) return PinStatus::LocalPath;
    if (value.starts_with("docker://")) {
        return value.find("@sha256:") != std::string_view::npos ? PinStatus::Pinned : PinStatus::FloatingTag;
    }
    auto at = value.rfind('@');
    if (at == std::string_view::npos || at + 1 == value.size()) return PinStatus::Malformed;
    return is_hex40(value.substr(at + 1)) ? PinStatus::Pinned : PinStatus::FloatingTag;
}

PinStatus classify_image(std::string_view value) {
    if (value.empty() || value.find("${{") != std::string_view::npos) return PinStatus::Malformed;
    return value.find("@sha256:") != std::string_view::npos ? PinStatus::Pinned : PinStatus::FloatingTag;
}

ReferenceExtractor::ReferenceExtractor(std::string file)
    : file_(std::move(file)) {}

std::optional<ReferenceExtractor::KeyLine> ReferenceExtractor::split_key(std::string_view line, size_t indent) {
    size_t p = indent;
    // "- uses: x", "-   image: y"
    while (p < line.size() && line[p] == '-' && (p + 1 == line.size() || line[p + 1] == ' ' || line[p + 1] == '\t')) {
        ++p;
        while (p < line.size() && (line[p] == ' ' || line[p] == '\t')) ++p;
    }

    size_t key_start = p;
    while (p < line.size() && (std::isalnum(static_cast<unsigned char>(line[p])) || line[p] == '_' || line[p] == '-')) ++p;
    if (p == key_start || p >= line.size() || line[p] != ':') return std::nullopt;
    if (p + 1 < line.size() && line[p + 1] != ' ' && line[p + 1] != '\t') return std::nullopt;

    KeyLine kl;
    kl.key = line.substr(key_start, p - key_start);

    size_t v = p + 1;
    while (v < line.size() && (line[v] == ' ' || line[v] == '\t')) ++v;
    kl.value_offset = v;
    if (v >= line.size() || line[v] == '#') return kl;

    if (line[v] == '"' || line[v] == '\'') {
        auto close = line.find(line[v], v + 1);
        if (close != std::string_view::npos) {
            kl.quote = line[v];
            kl.value_offset = v + 1;
            kl.value = line.substr(v + 1, close - v - 1);
            return kl;
        }
    }

    auto end = line.size();
    for (size_t i = v; i < line.size(); ++i) {
        if (line[i] == '#' && (line[i - 1] == ' ' || line[i - 1] == '\t')) {
            end = i;
            break;
        }
    }
    while (end > v && (line[end - 1] == ' ' || line[end - 1] == '\t')) --end;
    kl.value = line.substr(v, end - v);
    return kl;
}

void ReferenceExtractor::emit(const KeyLine& kl, RefKind kind, size_t line_number,
                              std::vector<WorkflowReference>& out) const {
    WorkflowReference ref;
    ref.file = file_;
    ref.line_number = line_number;
    ref.kind = kind;
    ref.raw_value = std::string(kl.value);
    ref.status = kind == RefKind::Action ? classify_action(kl.value) : classify_image(kl.value);
    ref.value_offset = kl.value_offset;
    ref.value_length = kl.value.size();
    ref.quote = kl.quote;
    out.push_back(std::move(ref));
}

void ReferenceExtractor::feed(std::string_view line, size_t line_number, std::vector<WorkflowReference>& out) {
    if (line.ends_with('\r')) line.remove_suffix(1);

    size_t indent = 0;
    while (indent < line.size() && (line[indent] == ' ' || line[indent] == '\t')) ++indent;
    if (indent == line.size() || line[indent] == '#') return;

    // Exit transitions come first so a sibling key can re-enter a block
    container_.leave_if_dedented(indent);
    services_.leave_if_dedented(indent);

    auto kl = split_key(line, indent);
    if (!kl) return;

    if (kl->key == "container") {
        if (kl->value.empty() || kl->value.front() == '{' || kl->value.front() == '[') {
            container_.enter(indent);
        } else {
            emit(*kl, RefKind::ContainerImage, line_number, out);
        }
    } else if (kl->key == "services") {
        services_.enter(indent);
    } else if (kl->key == "image") {
        if (!container_.active && !services_.active) return;
        bool innermost_container = container_.active && (!services_.active || container_.indent > services_.indent);
        emit(*kl, innermost_container ? RefKind::ContainerImage : RefKind::ServiceImage, line_number, out);
    } else if (kl->key == "uses") {
        emit(*kl, RefKind::Action, line_number, out);
    }
}

std::vector<WorkflowReference> ReferenceExtractor::extract(std::string file, std::string_view content) {
    ReferenceExtractor extractor(std::move(file));
    std::vector<WorkflowReference> refs;
    size_t line_no = 0;
    size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos) end = content.size();
        extractor.feed(content.substr(pos, end - pos), ++line_no, refs);
        pos = end + 1;
    }
    return refs;
}

} // namespace pushgate
