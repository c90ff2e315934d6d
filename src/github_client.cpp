#include "github_client.hpp"
#include "workflow_refs.hpp"
#include "string_utils.hpp"
#include "compact_log.hpp"
#include <cstdlib>

namespace pushgate {

static std::string token_from_env() {
    for (const char* name : {"GITHUB_TOKEN", "GH_TOKEN"}) {
        if (const char* v = std::getenv(name); v && *v) return v;
    }
    return {};
}

GitHubClient::GitHubClient() : GitHubClient(token_from_env()) {}

GitHubClient::GitHubClient(std::string token) : token_(std::move(token)) {
    http_client_.set_header("X-GitHub-Api-Version", "2022-11-28");
    if (!token_.empty()) {
        http_client_.set_header("Authorization", "Bearer " + token_);
    }
}

std::string GitHubClient::commit_url(const std::string& repo, const std::string& ref) {
    return "https://api.github.com/repos/" + repo + "/commits/" + HttpClient::url_encode(ref);
}

std::expected<std::string, GitHubErrorInfo> GitHubClient::resolve_commit_sha(
    const std::string& repo, const std::string& ref
) {
    // The sha media type answers with the bare commit id
    auto response = http_client_.get_full(commit_url(repo, ref),
                                          {{"Accept", "application/vnd.github.sha"}});
    if (!response) {
        return std::unexpected(GitHubErrorInfo{GitHubError::NetworkError, response.error().message});
    }

    switch (response->status_code) {
        case 200:
            break;
        case 401:
            return std::unexpected(GitHubErrorInfo{GitHubError::AuthRequired, "GitHub rejected the token"});
        case 403:
        case 429:
            return std::unexpected(GitHubErrorInfo{GitHubError::RateLimited,
                "GitHub API rate limit hit (set GITHUB_TOKEN)"});
        case 404:
        case 422:
            return std::unexpected(GitHubErrorInfo{GitHubError::RefNotFound,
                repo + "@" + ref + " not found"});
        default:
            return std::unexpected(GitHubErrorInfo{GitHubError::NetworkError,
                "HTTP Error " + std::to_string(response->status_code)});
    }

    auto sha = str::to_lower(str::trim(response->body));
    if (!is_hex40(sha)) {
        return std::unexpected(GitHubErrorInfo{GitHubError::InvalidResponse,
            "unexpected commit response for " + repo + "@" + ref});
    }
    Log::debug("github", repo + "@" + ref + " -> " + sha);
    return sha;
}

} // namespace pushgate
