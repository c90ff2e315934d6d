#pragma once

#include "config.hpp"
#include <string>
#include <string_view>
#include <map>
#include <memory>
#include <expected>

namespace pushgate {

enum class ResolveError {
    NotFound,
    Network,
    InvalidResponse,
    Unsupported
};

struct ResolveErrorInfo {
    ResolveError error;
    std::string message;
};

// Turns mutable references into immutable identifiers
class RefResolver {
public:
    virtual ~RefResolver() = default;

    // 40-hex commit that `ref` (tag or branch) of `owner/repo` points to
    virtual std::expected<std::string, ResolveErrorInfo> resolve_commit(
        const std::string& repo, const std::string& ref) = 0;

    // "sha256:<hex>" manifest digest of `[registry/]name[:tag]`
    virtual std::expected<std::string, ResolveErrorInfo> resolve_image_digest(const std::string& image) = 0;
};

// Memoizes another resolver for the lifetime of one run, failures included
class CachingResolver : public RefResolver {
public:
    explicit CachingResolver(RefResolver& inner) : inner_(inner) {}

    std::expected<std::string, ResolveErrorInfo> resolve_commit(
        const std::string& repo, const std::string& ref) override;
    std::expected<std::string, ResolveErrorInfo> resolve_image_digest(const std::string& image) override;

    size_t hits() const { return hits_; }

private:
    RefResolver& inner_;
    std::map<std::string, std::expected<std::string, ResolveErrorInfo>> cache_;
    size_t hits_ = 0;
};

class GitHubClient;
class RegistryClient;

// Commits via the GitHub API or `git ls-remote`, digests via the registry v2 API
class RemoteResolver : public RefResolver {
public:
    RemoteResolver(ResolverBackend backend, long timeout_seconds);
    ~RemoteResolver() override;

    std::expected<std::string, ResolveErrorInfo> resolve_commit(
        const std::string& repo, const std::string& ref) override;
    std::expected<std::string, ResolveErrorInfo> resolve_image_digest(const std::string& image) override;

    // Picks the commit for `ref` out of ls-remote output: peeled tag, tag, then branch head
    static std::expected<std::string, ResolveErrorInfo> pick_ls_remote_commit(
        std::string_view output, const std::string& ref);

private:
    ResolverBackend backend_;
    std::unique_ptr<GitHubClient> github_;
    std::unique_ptr<RegistryClient> registry_;
};

} // namespace pushgate
