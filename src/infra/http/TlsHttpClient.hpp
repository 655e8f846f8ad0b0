#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace infra::http {

struct HttpRequest {
    std::string host;
    std::string port{"443"};
    std::string target;
    std::vector<std::pair<std::string, std::string>> headers;
    std::chrono::milliseconds timeout{std::chrono::seconds(20)};
};

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
    std::string retry_after;
};

// Provider adapters take the transport as a parameter so tests can replay
// canned payloads.
using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

// Performs an HTTPS GET, following up to five same-scheme redirects.
// request.timeout bounds each attempt from DNS lookup to the last byte read.
// Returns every status code to the caller.
// Throws std::runtime_error on DNS, connect, TLS, timeout or read errors.
HttpResponse https_get(const HttpRequest& request);

HttpTransport default_transport();

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(std::string_view value);

}  // namespace infra::http
