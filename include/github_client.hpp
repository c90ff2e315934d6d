#pragma once

#include "http_client.hpp"
#include <string>
#include <expected>

namespace pushgate {

enum class GitHubError {
    AuthRequired,
    RefNotFound,
    RateLimited,
    InvalidResponse,
    NetworkError
};

struct GitHubErrorInfo {
    GitHubError error;
    std::string message;
};

class GitHubClient {
public:
    // Token from GITHUB_TOKEN / GH_TOKEN when present
    GitHubClient();
    explicit GitHubClient(std::string token);

    void set_timeout(long seconds) { http_client_.set_timeout(seconds); }

    // Commit SHA that `ref` of `owner/repo` resolves to
    std::expected<std::string, GitHubErrorInfo> resolve_commit_sha(
        const std::string& repo, const std::string& ref);

    static std::string commit_url(const std::string& repo, const std::string& ref);

private:
    std::string token_;
    HttpClient http_client_;
};

} // namespace pushgate
