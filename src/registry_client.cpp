#include "registry_client.hpp"
#include "checksum.hpp"
#include "compact_log.hpp"
#include "json.hpp"
#include "string_utils.hpp"

namespace pushgate {

namespace {

constexpr std::string_view kManifestAccept =
    "application/vnd.oci.image.index.v1+json, "
    "application/vnd.docker.distribution.manifest.list.v2+json, "
    "application/vnd.oci.image.manifest.v1+json, "
    "application/vnd.docker.distribution.manifest.v2+json";

bool looks_like_registry_host(std::string_view segment) {
    return segment.find('.') != std::string_view::npos ||
           segment.find(':') != std::string_view::npos ||
           segment == "localhost";
}

} // namespace

std::string ImageReference::manifest_url() const {
    return "https://" + registry + "/v2/" + repository + "/manifests/" + tag;
}

std::expected<ImageReference, RegistryErrorInfo> parse_image_reference(std::string_view image) {
    if (image.starts_with("docker://")) image.remove_prefix(9);
    image = str::trim(image);
    if (image.empty() || image.find('@') != std::string_view::npos ||
        image.find(' ') != std::string_view::npos) {
        return std::unexpected(RegistryErrorInfo{RegistryError::InvalidReference,
            "cannot resolve image reference '" + std::string(image) + "'"});
    }

    ImageReference ref;
    std::string_view rest = image;
    auto slash = rest.find('/');
    if (slash != std::string_view::npos && looks_like_registry_host(rest.substr(0, slash))) {
        ref.registry = std::string(rest.substr(0, slash));
        rest.remove_prefix(slash + 1);
    } else {
        ref.registry = "docker.io";
    }

    // A ':' after the last '/' separates the tag
    auto last_slash = rest.rfind('/');
    auto colon = rest.rfind(':');
    if (colon != std::string_view::npos && (last_slash == std::string_view::npos || colon > last_slash)) {
        ref.tag = std::string(rest.substr(colon + 1));
        ref.explicit_tag = true;
        rest = rest.substr(0, colon);
    }
    if (rest.empty() || ref.tag.empty()) {
        return std::unexpected(RegistryErrorInfo{RegistryError::InvalidReference,
            "cannot resolve image reference '" + std::string(image) + "'"});
    }

    ref.repository = str::to_lower(rest);
    if (ref.registry == "docker.io" || ref.registry == "index.docker.io") {
        ref.registry = "registry-1.docker.io";
        if (ref.repository.find('/') == std::string::npos) ref.repository = "library/" + ref.repository;
    }
    return ref;
}

std::string BearerChallenge::token_url() const {
    std::string url = realm;
    char sep = realm.find('?') == std::string::npos ? '?' : '&';
    if (!service.empty()) {
        url += sep;
        url += "service=" + HttpClient::url_encode(service);
        sep = '&';
    }
    if (!scope.empty()) {
        url += sep;
        url += "scope=" + HttpClient::url_encode(scope);
    }
    return url;
}

std::optional<BearerChallenge> parse_bearer_challenge(std::string_view header) {
    header = str::trim(header);
    if (header.size() < 7 || str::to_lower(header.substr(0, 7)) != "bearer ") return std::nullopt;
    header.remove_prefix(7);

    BearerChallenge challenge;
    size_t p = 0;
    while (p < header.size()) {
        while (p < header.size() && (header[p] == ' ' || header[p] == ',')) ++p;
        auto eq = header.find('=', p);
        if (eq == std::string_view::npos) break;
        auto key = str::to_lower(str::trim(header.substr(p, eq - p)));
        std::string value;
        size_t v = eq + 1;
        if (v < header.size() && header[v] == '"') {
            auto close = header.find('"', v + 1);
            if (close == std::string_view::npos) close = header.size();
            value = std::string(header.substr(v + 1, close - v - 1));
            p = close + 1;
        } else {
            auto comma = header.find(',', v);
            if (comma == std::string_view::npos) comma = header.size();
            value = std::string(str::trim(header.substr(v, comma - v)));
            p = comma;
        }
        if (key == "realm") challenge.realm = value;
        else if (key == "service") challenge.service = value;
        else if (key == "scope") challenge.scope = value;
    }
    if (challenge.realm.empty()) return std::nullopt;
    return challenge;
}

RegistryClient::RegistryClient() = default;

std::expected<std::string, RegistryErrorInfo> RegistryClient::fetch_token(const BearerChallenge& challenge) {
    auto body = http_client_.get(challenge.token_url());
    if (!body) {
        return std::unexpected(RegistryErrorInfo{RegistryError::AuthFailed,
            "token request failed: " + body.error().message});
    }
    if (auto token = json::find_string(*body, "token")) return *token;
    if (auto token = json::find_string(*body, "access_token")) return *token;
    return std::unexpected(RegistryErrorInfo{RegistryError::AuthFailed, "token response carried no token"});
}

std::expected<std::string, RegistryErrorInfo> RegistryClient::resolve_digest(std::string_view image) {
    auto ref = parse_image_reference(image);
    if (!ref) return std::unexpected(ref.error());

    const auto url = ref->manifest_url();
    HeaderMap headers{{"Accept", std::string(kManifestAccept)}};
    auto response = http_client_.get_full(url, headers);
    if (!response) {
        return std::unexpected(RegistryErrorInfo{RegistryError::NetworkError, response.error().message});
    }

    // Anonymous pulls still need a bearer token on most registries
    if (response->status_code == 401) {
        auto header = response->header("www-authenticate");
        auto challenge = header ? parse_bearer_challenge(*header) : std::nullopt;
        if (!challenge) {
            return std::unexpected(RegistryErrorInfo{RegistryError::AuthFailed,
                "registry " + ref->registry + " requires unsupported authentication"});
        }
        auto token = fetch_token(*challenge);
        if (!token) return std::unexpected(token.error());
        headers["Authorization"] = "Bearer " + *token;
        response = http_client_.get_full(url, headers);
        if (!response) {
            return std::unexpected(RegistryErrorInfo{RegistryError::NetworkError, response.error().message});
        }
    }

    if (response->status_code == 401 || response->status_code == 403) {
        return std::unexpected(RegistryErrorInfo{RegistryError::AuthFailed,
            "access denied to " + ref->repository});
    }
    if (response->status_code == 404) {
        return std::unexpected(RegistryErrorInfo{RegistryError::ManifestNotFound,
            ref->repository + ":" + ref->tag + " not found"});
    }
    if (response->status_code >= 400) {
        return std::unexpected(RegistryErrorInfo{RegistryError::NetworkError,
            "HTTP Error " + std::to_string(response->status_code)});
    }

    std::string digest;
    if (auto header = response->header("docker-content-digest"); header && header->starts_with("sha256:")) {
        digest = *header;
    } else {
        digest = "sha256:" + sha256_hex(response->body);
    }
    Log::debug("registry", std::string(image) + " -> " + digest);
    return digest;
}

} // namespace pushgate
