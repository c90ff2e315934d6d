#pragma once

#include <string>
#include <string_view>
#include <map>
#include <memory>
#include <optional>
#include <expected>

namespace pushgate {

enum class HttpError {
    NetworkError,
    InvalidUrl,
    HttpStatusError,
    Timeout
};

struct HttpErrorInfo {
    HttpError error;
    std::string message;
    int status_code = 0;
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string body;

    std::optional<std::string> header(std::string_view name) const;
};

using HeaderMap = std::map<std::string, std::string>;

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // Delete copy operations
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Allow move operations
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    // Any status code is a value; only transport failures are errors
    std::expected<HttpResponse, HttpErrorInfo> get_full(std::string_view url, const HeaderMap& extra_headers = {});

    // Body of a 2xx/3xx response
    std::expected<std::string, HttpErrorInfo> get(std::string_view url, const HeaderMap& extra_headers = {});

    // Sent with every request
    void set_header(std::string_view key, std::string_view value);

    // Set timeout in seconds
    void set_timeout(long seconds);

    static std::string url_encode(std::string_view s);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace pushgate
