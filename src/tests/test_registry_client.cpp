#include "registry_client.hpp"
#include "ref_resolver.hpp"
#include "checksum.hpp"
#include "json.hpp"
#include <iostream>
#include <cassert>

using namespace pushgate;

void test_image_references() {
    std::cout << "Testing image reference parsing...\n\n";

    // Test 1: official Docker Hub image
    {
        auto ref = parse_image_reference("node:20");
        assert(ref.has_value());
        assert(ref->registry == "registry-1.docker.io");
        assert(ref->repository == "library/node");
        assert(ref->tag == "20");
        assert(ref->explicit_tag);
        assert(ref->manifest_url() == "https://registry-1.docker.io/v2/library/node/manifests/20");
        std::cout << "✓ Test 1 passed: Official image\n";
    }

    // Test 2: implicit latest, user namespace
    {
        auto ref = parse_image_reference("bitnami/redis");
        assert(ref.has_value());
        assert(ref->repository == "bitnami/redis");
        assert(ref->tag == "latest");
        assert(!ref->explicit_tag);
        std::cout << "✓ Test 2 passed: Implicit tag\n";
    }

    // Test 3: explicit registry with port, docker:// prefix
    {
        auto ghcr = parse_image_reference("docker://ghcr.io/owner/tool:1.2");
        assert(ghcr.has_value());
        assert(ghcr->registry == "ghcr.io");
        assert(ghcr->repository == "owner/tool");
        assert(ghcr->tag == "1.2");

        auto local = parse_image_reference("localhost:5000/app");
        assert(local.has_value());
        assert(local->registry == "localhost:5000");
        assert(local->repository == "app");
        assert(local->tag == "latest");
        std::cout << "✓ Test 3 passed: Registry hosts\n";
    }

    // Test 4: unresolvable references
    {
        assert(!parse_image_reference("").has_value());
        assert(!parse_image_reference("node@sha256:abc").has_value());
        assert(!parse_image_reference("node:").has_value());
        assert(parse_image_reference("node:").error().error == RegistryError::InvalidReference);
        std::cout << "✓ Test 4 passed: Invalid references\n";
    }
}

void test_token_and_listing() {
    std::cout << "\nTesting auth challenge and ref listing...\n\n";

    // Test 5: bearer challenge
    {
        auto c = parse_bearer_challenge(
            "Bearer realm=\"https://auth.docker.io/token\",service=\"registry.docker.io\","
            "scope=\"repository:library/node:pull\"");
        assert(c.has_value());
        assert(c->realm == "https://auth.docker.io/token");
        assert(c->service == "registry.docker.io");
        assert(c->token_url() ==
               "https://auth.docker.io/token?service=registry.docker.io&scope=repository%3Alibrary%2Fnode%3Apull");
        assert(!parse_bearer_challenge("Basic realm=\"x\"").has_value());
        std::cout << "✓ Test 5 passed: Bearer challenge\n";
    }

    // Test 6: token documents
    {
        assert(json::find_string("{\"token\":\"abc\",\"expires_in\":300}", "token").value() == "abc");
        assert(json::find_string("{\"access_token\": \"x\\/y\"}", "access_token").value() == "x/y");
        assert(json::find_string("{\"nested\":{\"token\":\"inner\"}}", "token") == std::nullopt);
        assert(json::find_string("not json", "token") == std::nullopt);
        std::cout << "✓ Test 6 passed: Token extraction\n";
    }

    // Test 7: ls-remote output prefers the peeled tag
    {
        std::string tag_obj(40, 'a');
        std::string commit(40, 'b');
        std::string branch(40, 'c');
        std::string output =
            tag_obj + "\trefs/tags/v4\n" +
            commit + "\trefs/tags/v4^{}\n" +
            branch + "\trefs/heads/v4\n";
        assert(RemoteResolver::pick_ls_remote_commit(output, "v4").value() == commit);
        assert(RemoteResolver::pick_ls_remote_commit(tag_obj + "\trefs/tags/v4\n", "v4").value() == tag_obj);
        assert(RemoteResolver::pick_ls_remote_commit(branch + "\trefs/heads/main\n", "main").value() == branch);
        auto missing = RemoteResolver::pick_ls_remote_commit("", "v9");
        assert(!missing.has_value());
        assert(missing.error().error == ResolveError::NotFound);
        std::cout << "✓ Test 7 passed: ls-remote selection\n";
    }

    // Test 8: manifest digest fallback hashing
    {
        assert(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        assert(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
        std::cout << "✓ Test 8 passed: SHA-256\n";
    }
}

int main() {
    test_image_references();
    test_token_and_listing();
    std::cout << "\n✅ All registry and resolver tests passed!\n";
    return 0;
}
