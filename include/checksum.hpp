#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <expected>

namespace pushgate {

struct ChecksumError {
    std::string message;
};

// Lower-case hex SHA-256
std::string sha256_hex(std::string_view data);
std::expected<std::string, ChecksumError> sha256_file(const std::filesystem::path& path);

} // namespace pushgate
