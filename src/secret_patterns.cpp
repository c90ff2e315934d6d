#include "secret_patterns.hpp"
#include "string_utils.hpp"
#include <array>
#include <cmath>
#include <fstream>
#include <sstream>

namespace pushgate {

std::string_view category_name(SecretCategory category) {
    switch (category) {
        case SecretCategory::CloudCredential: return "cloud-credential";
        case SecretCategory::ForgeToken: return "forge-token";
        case SecretCategory::PlatformToken: return "platform-token";
        case SecretCategory::PrivateKey: return "private-key";
        case SecretCategory::WebhookToken: return "webhook-token";
        case SecretCategory::BearerToken: return "bearer-token";
        case SecretCategory::ConnectionString: return "connection-string";
        case SecretCategory::GenericAssignment: return "generic-secret";
    }
    return "unknown";
}

PatternCatalog::PatternCatalog() {
    init_patterns();
}

void PatternCatalog::init_patterns() {
    const auto icase = std::regex::ECMAScript | std::regex::icase;
    const auto plain = std::regex::ECMAScript;

    patterns_ = {
        {"aws-access-key-id",
         std::regex(R"(\b((?:A3T[A-Z0-9]|AKIA|ASIA|ABIA|ACCA)[A-Z0-9]{16})\b)", plain),
         SecretCategory::CloudCredential, 1},
        {"aws-secret-access-key",
         std::regex(R"(aws_?secret_?access_?key["']?\s*(?::=|=>|[:=])\s*["']?([A-Za-z0-9/+=]{40,}))", icase),
         SecretCategory::CloudCredential, 1},
        {"gcp-api-key",
         std::regex(R"(\b(AIza[0-9A-Za-z_\-]{35}))", plain),
         SecretCategory::CloudCredential, 1},
        {"github-token",
         std::regex(R"(\b((?:ghp|gho|ghu|ghs|ghr)_[0-9A-Za-z]{36,255}))", plain),
         SecretCategory::ForgeToken, 1},
        {"github-fine-grained-pat",
         std::regex(R"(\b(github_pat_[0-9A-Za-z_]{22,255}))", plain),
         SecretCategory::ForgeToken, 1},
        {"gitlab-pat",
         std::regex(R"(\b(glpat-[0-9A-Za-z_\-]{20,}))", plain),
         SecretCategory::ForgeToken, 1},
        {"openai-api-key",
         std::regex(R"(\b(sk-(?:proj|svcacct|admin)-[A-Za-z0-9_\-]{20,}|sk-[A-Za-z0-9]{32,}))", plain),
         SecretCategory::PlatformToken, 1},
        {"stripe-live-key",
         std::regex(R"(\b((?:sk|rk)_live_[0-9A-Za-z]{24,}))", plain),
         SecretCategory::PlatformToken, 1},
        {"docker-hub-pat",
         std::regex(R"(\b(dckr_pat_[A-Za-z0-9_\-]{20,}))", plain),
         SecretCategory::PlatformToken, 1},
        {"slack-token",
         std::regex(R"(\b(xox[baprsou]-[0-9A-Za-z\-]{10,}))", plain),
         SecretCategory::WebhookToken, 1},
        {"slack-webhook",
         std::regex(R"(https://hooks\.slack\.com/services/(T[A-Za-z0-9_]+/B[A-Za-z0-9_]+/[A-Za-z0-9_]+))", plain),
         SecretCategory::WebhookToken, 1},
        {"private-key",
         std::regex(R"((-----BEGIN[ A-Z0-9_\-]{0,100}PRIVATE KEY(?: BLOCK)?-----))", plain),
         SecretCategory::PrivateKey, 1},
        {"jwt",
         std::regex(R"(\b(eyJ[A-Za-z0-9_\-]{10,}\.eyJ[A-Za-z0-9_\-]{10,}\.[A-Za-z0-9_\-]{10,}))", plain),
         SecretCategory::BearerToken, 1, false},
        {"bearer-token",
         std::regex(R"(\bbearer\s+([A-Za-z0-9_\-.~+/]{20,}=*))", icase),
         SecretCategory::BearerToken, 1, false},
        {"connection-string-password",
         std::regex(R"(\b(?:postgres(?:ql)?|mysql|mariadb|mssql|mongodb(?:\+srv)?|rediss?|amqps?)://[^:\s/@]+:([^@\s/]{3,})@)", icase),
         SecretCategory::ConnectionString, 1, false},
        {"generic-secret-assignment",
         std::regex(R"((?:secret|passw(?:or)?d|api[_\-]?key|access[_\-]?key|auth[_\-]?key|token|client[_\-]?secret|private[_\-]?key)[A-Za-z0-9_\-]*["']?\s*(?::=|=>|[:=])\s*["']?([A-Za-z0-9_\-+/=.~]{16,}))", icase),
         SecretCategory::GenericAssignment, 1, false, true},
    };
}

const SecretPattern* PatternCatalog::find(std::string_view id) const {
    for (const auto& p : patterns_) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

bool PatternCatalog::acceptable(const SecretPattern& pattern, std::string_view value) const {
    if (looks_like_placeholder(value)) return false;
    if (!pattern.generic) return true;

    if (value.size() < kMinGenericValueLength) return false;
    bool has_alpha = false, has_digit = false;
    for (unsigned char c : value) {
        if (std::isalpha(c)) has_alpha = true;
        else if (std::isdigit(c)) has_digit = true;
    }
    if (!has_alpha || !has_digit) return false;
    return shannon_entropy(value) >= kMinGenericEntropy;
}

std::optional<PatternMatch> PatternCatalog::match(const std::string& line, bool lock_file) const {
    if (line.size() < kMinCandidateLength) return std::nullopt;

    for (const auto& pattern : patterns_) {
        if (lock_file && !pattern.applies_to_lock_files) continue;

        auto begin = std::sregex_iterator(line.begin(), line.end(), pattern.regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const auto& m = *it;
            auto group = m[pattern.secret_group].matched ? pattern.secret_group : 0;
            auto offset = static_cast<size_t>(m.position(group));
            auto length = static_cast<size_t>(m.length(group));
            if (!acceptable(pattern, std::string_view(line).substr(offset, length))) continue;
            return PatternMatch{&pattern, offset, length};
        }
    }
    return std::nullopt;
}

double shannon_entropy(std::string_view value) {
    if (value.empty()) return 0.0;
    std::array<size_t, 256> counts{};
    for (unsigned char c : value) ++counts[c];
    double entropy = 0.0;
    const double n = static_cast<double>(value.size());
    for (auto count : counts) {
        if (count == 0) continue;
        double p = static_cast<double>(count) / n;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

bool looks_like_placeholder(std::string_view value) {
    static const std::array<std::string_view, 22> markers = {
        "example", "sample", "dummy", "placeholder", "changeme", "change_me",
        "your_", "your-", "yourpassword", "yourtoken", "replace", "redacted",
        "insert", "xxxxxxxx", "********", "<", "${", "{{", "%(",
        "process.env", "os.environ", "getenv"
    };
    static const std::array<std::string_view, 9> exact = {
        "password", "passwd", "secret", "token", "pass", "null", "none", "true", "false"
    };

    auto lower = str::to_lower(value);
    for (auto marker : markers) {
        if (lower.find(marker) != std::string::npos) return true;
    }
    for (auto word : exact) {
        if (lower == word) return true;
    }
    return false;
}

std::expected<Allowlist, AllowlistErrorInfo> Allowlist::parse(std::string_view text) {
    Allowlist list;
    size_t line_no = 0;
    size_t pos = 0;
    while (pos <= text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos) end = text.size();
        auto line = str::trim(text.substr(pos, end - pos));
        pos = end + 1;
        ++line_no;
        if (line.empty() || line.front() == '#') continue;

        try {
            list.rules_.push_back(Rule{std::string(line), std::regex(std::string(line), std::regex::ECMAScript)});
        } catch (const std::regex_error& e) {
            return std::unexpected(AllowlistErrorInfo{AllowlistError::InvalidRegex,
                "invalid allowlist regex '" + std::string(line) + "': " + e.what(), line_no});
        }
    }
    return list;
}

std::expected<Allowlist, AllowlistErrorInfo> Allowlist::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return Allowlist{};

    std::ifstream file(path);
    if (!file) {
        return std::unexpected(AllowlistErrorInfo{AllowlistError::ReadFailed, "cannot read " + path.string()});
    }
    std::ostringstream content;
    content << file.rdbuf();

    auto list = parse(content.str());
    if (!list) {
        auto err = list.error();
        err.message = path.string() + ":" + std::to_string(err.line) + ": " + err.message;
        return std::unexpected(err);
    }
    return list;
}

bool Allowlist::allows(const std::string& line) const {
    for (const auto& rule : rules_) {
        if (std::regex_search(line, rule.regex)) return true;
    }
    return false;
}

} // namespace pushgate
