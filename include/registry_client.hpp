#pragma once

#include "http_client.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <expected>

namespace pushgate {

enum class RegistryError {
    InvalidReference,
    AuthFailed,
    ManifestNotFound,
    NetworkError
};

struct RegistryErrorInfo {
    RegistryError error;
    std::string message;
};

// `[registry/]name[:tag]` split into its request parts
struct ImageReference {
    std::string registry;    // API host, docker.io mapped to registry-1.docker.io
    std::string repository;  // library/ prefixed for official Docker Hub images
    std::string tag = "latest";
    bool explicit_tag = false;

    std::string manifest_url() const;
};

std::expected<ImageReference, RegistryErrorInfo> parse_image_reference(std::string_view image);

// Parameters of a `WWW-Authenticate: Bearer realm=...,service=...,scope=...` challenge
struct BearerChallenge {
    std::string realm;
    std::string service;
    std::string scope;

    std::string token_url() const;
};

std::optional<BearerChallenge> parse_bearer_challenge(std::string_view header);

class RegistryClient {
public:
    RegistryClient();

    void set_timeout(long seconds) { http_client_.set_timeout(seconds); }

    // "sha256:<hex>" of the manifest (or index) the tag points to
    std::expected<std::string, RegistryErrorInfo> resolve_digest(std::string_view image);

private:
    HttpClient http_client_;

    std::expected<std::string, RegistryErrorInfo> fetch_token(const BearerChallenge& challenge);
};

} // namespace pushgate
