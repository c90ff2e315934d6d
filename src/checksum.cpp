#include "checksum.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace pushgate {

namespace {

class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new()) {
        EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr);
    }
    ~Sha256() { EVP_MD_CTX_free(ctx_); }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, size_t len) { EVP_DigestUpdate(ctx_, data, len); }

    std::string hex() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        EVP_DigestFinal_ex(ctx_, hash, &hash_len);
        std::ostringstream oss;
        for (unsigned int i = 0; i < hash_len; ++i) {
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return oss.str();
    }

private:
    EVP_MD_CTX* ctx_;
};

} // namespace

std::string sha256_hex(std::string_view data) {
    Sha256 sha;
    sha.update(data.data(), data.size());
    return sha.hex();
}

std::expected<std::string, ChecksumError> sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::unexpected(ChecksumError{"cannot open " + path.string()});
    Sha256 sha;
    char buf[4096];
    while (file.good()) {
        file.read(buf, sizeof(buf));
        std::streamsize n = file.gcount();
        if (n > 0) sha.update(buf, static_cast<size_t>(n));
    }
    if (file.bad()) return std::unexpected(ChecksumError{"read error on " + path.string()});
    return sha.hex();
}

} // namespace pushgate
