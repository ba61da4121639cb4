#pragma once

#include <string>
#include <string_view>

namespace utils
{

struct HttpTimeouts
{
    int connect_ms = 3000;
    int total_ms = 30000;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // transport failure, empty when a status line was received

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    // "HTTP 503" or the transport error, for log lines and exceptions
    std::string describe() const;
};

// A server reached under one base URL, e.g. "http://localhost:11434"
class HttpEndpoint
{
public:
    explicit HttpEndpoint(std::string base_url);

    bool empty() const { return base_url_.empty(); }
    const std::string& baseUrl() const { return base_url_; }

    // base URL joined with path, exactly one '/' between them
    std::string urlFor(std::string_view path) const;

    HttpResponse get(std::string_view path, const HttpTimeouts& timeouts) const;
    HttpResponse postJson(std::string_view path, const std::string& body, const HttpTimeouts& timeouts) const;

private:
    std::string base_url_;
};

} // namespace utils
