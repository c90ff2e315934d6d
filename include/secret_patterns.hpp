#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <regex>
#include <optional>
#include <expected>
#include <filesystem>

namespace pushgate {

enum class SecretCategory {
    CloudCredential,
    ForgeToken,
    PlatformToken,
    PrivateKey,
    WebhookToken,
    BearerToken,
    ConnectionString,
    GenericAssignment
};

std::string_view category_name(SecretCategory category);

struct SecretPattern {
    std::string id;
    std::regex regex;
    SecretCategory category;
    size_t secret_group = 0;          // capture group holding the secret value
    bool applies_to_lock_files = true;
    bool generic = false;             // value must also pass the entropy heuristics
};

struct PatternMatch {
    const SecretPattern* pattern = nullptr;
    size_t secret_offset = 0;
    size_t secret_length = 0;
};

// Built-in signatures, ordered from specific provider prefixes to generic
// assignments. The first pattern with an acceptable match wins.
class PatternCatalog {
public:
    PatternCatalog();

    const std::vector<SecretPattern>& patterns() const { return patterns_; }

    std::optional<PatternMatch> match(const std::string& line, bool lock_file) const;

    const SecretPattern* find(std::string_view id) const;

    // Shortest line that can possibly hold a match; shorter lines skip the regex pass
    static constexpr size_t kMinCandidateLength = 15;

    // Minimum length of a generic `key = value` secret
    static constexpr size_t kMinGenericValueLength = 16;
    static constexpr double kMinGenericEntropy = 3.0;

private:
    std::vector<SecretPattern> patterns_;

    void init_patterns();
    bool acceptable(const SecretPattern& pattern, std::string_view value) const;
};

// Shannon entropy in bits per character
double shannon_entropy(std::string_view value);

// Documentation keys and template placeholders that must never be reported
bool looks_like_placeholder(std::string_view value);

enum class AllowlistError {
    ReadFailed,
    InvalidRegex
};

struct AllowlistErrorInfo {
    AllowlistError error;
    std::string message;
    size_t line = 0;
};

class Allowlist {
public:
    Allowlist() = default;

    // One ECMAScript regex per line; blank lines and '#' comments are skipped
    static std::expected<Allowlist, AllowlistErrorInfo> parse(std::string_view text);

    // A missing file is an empty allowlist
    static std::expected<Allowlist, AllowlistErrorInfo> load(const std::filesystem::path& path);

    bool allows(const std::string& line) const;
    size_t size() const { return rules_.size(); }

private:
    struct Rule {
        std::string source;
        std::regex regex;
    };
    std::vector<Rule> rules_;
};

} // namespace pushgate
