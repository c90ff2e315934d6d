#include "ref_resolver.hpp"
#include "github_client.hpp"
#include "registry_client.hpp"
#include "git_repo.hpp"
#include "workflow_refs.hpp"
#include "compact_log.hpp"

namespace pushgate {

std::expected<std::string, ResolveErrorInfo> CachingResolver::resolve_commit(
    const std::string& repo, const std::string& ref) {
    auto key = "commit:" + repo + "@" + ref;
    if (auto it = cache_.find(key); it != cache_.end()) {
        ++hits_;
        Log::debug("resolver", "cache hit " + key);
        return it->second;
    }
    auto result = inner_.resolve_commit(repo, ref);
    cache_.emplace(key, result);
    return result;
}

std::expected<std::string, ResolveErrorInfo> CachingResolver::resolve_image_digest(const std::string& image) {
    auto key = "image:" + image;
    if (auto it = cache_.find(key); it != cache_.end()) {
        ++hits_;
        Log::debug("resolver", "cache hit " + key);
        return it->second;
    }
    auto result = inner_.resolve_image_digest(image);
    cache_.emplace(key, result);
    return result;
}

RemoteResolver::RemoteResolver(ResolverBackend backend, long timeout_seconds)
    : backend_(backend),
      github_(std::make_unique<GitHubClient>()),
      registry_(std::make_unique<RegistryClient>()) {
    github_->set_timeout(timeout_seconds);
    registry_->set_timeout(timeout_seconds);
}

RemoteResolver::~RemoteResolver() = default;

std::expected<std::string, ResolveErrorInfo> RemoteResolver::pick_ls_remote_commit(
    std::string_view output, const std::string& ref) {
    std::string peeled, tag, head;
    size_t pos = 0;
    while (pos < output.size()) {
        auto end = output.find('\n', pos);
        if (end == std::string_view::npos) end = output.size();
        auto line = output.substr(pos, end - pos);
        pos = end + 1;

        auto tab = line.find('\t');
        if (tab == std::string_view::npos) continue;
        auto sha = std::string(line.substr(0, tab));
        auto name = line.substr(tab + 1);
        if (!is_hex40(sha)) continue;

        if (name == "refs/tags/" + ref + "^{}") peeled = sha;
        else if (name == "refs/tags/" + ref) tag = sha;
        else if (name == "refs/heads/" + ref) head = sha;
    }
    // An annotated tag's own object is not a commit; its peeled entry is
    if (!peeled.empty()) return peeled;
    if (!tag.empty()) return tag;
    if (!head.empty()) return head;
    return std::unexpected(ResolveErrorInfo{ResolveError::NotFound, "ref '" + ref + "' not found"});
}

std::expected<std::string, ResolveErrorInfo> RemoteResolver::resolve_commit(
    const std::string& repo, const std::string& ref) {
    if (backend_ == ResolverBackend::Git) {
        auto output = GitRepo::ls_remote("https://github.com/" + repo + ".git",
            {"refs/tags/" + ref, "refs/tags/" + ref + "^{}", "refs/heads/" + ref});
        if (!output) {
            auto kind = output.error().error == GitError::ToolMissing ? ResolveError::Unsupported
                                                                      : ResolveError::Network;
            return std::unexpected(ResolveErrorInfo{kind, output.error().message});
        }
        auto sha = pick_ls_remote_commit(*output, ref);
        if (!sha) return std::unexpected(ResolveErrorInfo{sha.error().error, repo + ": " + sha.error().message});
        return sha;
    }

    auto sha = github_->resolve_commit_sha(repo, ref);
    if (!sha) {
        switch (sha.error().error) {
            case GitHubError::RefNotFound:
                return std::unexpected(ResolveErrorInfo{ResolveError::NotFound, sha.error().message});
            case GitHubError::InvalidResponse:
                return std::unexpected(ResolveErrorInfo{ResolveError::InvalidResponse, sha.error().message});
            case GitHubError::AuthRequired:
            case GitHubError::RateLimited:
            case GitHubError::NetworkError:
                break;
        }
        return std::unexpected(ResolveErrorInfo{ResolveError::Network, sha.error().message});
    }
    return *sha;
}

std::expected<std::string, ResolveErrorInfo> RemoteResolver::resolve_image_digest(const std::string& image) {
    auto digest = registry_->resolve_digest(image);
    if (!digest) {
        switch (digest.error().error) {
            case RegistryError::InvalidReference:
                return std::unexpected(ResolveErrorInfo{ResolveError::Unsupported, digest.error().message});
            case RegistryError::ManifestNotFound:
                return std::unexpected(ResolveErrorInfo{ResolveError::NotFound, digest.error().message});
            case RegistryError::AuthFailed:
            case RegistryError::NetworkError:
                break;
        }
        return std::unexpected(ResolveErrorInfo{ResolveError::Network, digest.error().message});
    }
    return *digest;
}

} // namespace pushgate
