#include "infra/http/TlsHttpClient.hpp"

#include <cctype>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "marketdatacache/0.1";

std::runtime_error makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET https://" << host << target << " failed: " << message;
    return std::runtime_error(oss.str());
}

struct ParsedLocation {
    std::string host;
    std::string port;
    std::string target;
};

ParsedLocation parseRedirectLocation(const std::string& location,
                                     const std::string& currentHost,
                                     const std::string& currentPort) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }
    if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    }

    ParsedLocation result{currentHost, currentPort, location};
    if (location.rfind("https://", 0) == 0) {
        const std::string withoutScheme = location.substr(std::string{"https://"}.size());
        const auto slashPos = withoutScheme.find('/');
        std::string hostPart = withoutScheme.substr(0, slashPos);
        if (const auto colonPos = hostPart.find(':'); colonPos != std::string::npos) {
            if (hostPart.substr(colonPos + 1) != "443") {
                throw std::runtime_error("Redirect to unsupported HTTPS port: " + hostPart);
            }
            hostPart.resize(colonPos);
        }
        if (hostPart.empty()) {
            throw std::runtime_error("Redirect URL missing host");
        }
        result.host = hostPart;
        result.port = "443";
        result.target = slashPos == std::string::npos ? "/" : withoutScheme.substr(slashPos);
    } else if (location.front() != '/') {
        result.target = "/" + location;
    }
    return result;
}

// Runs the handlers of the operation just started. Stream operations finish
// on their own once the tcp_stream expiry passes.
void drive(net::io_context& ioc) {
    ioc.restart();
    ioc.run();
}

void throwOnError(const beast::error_code& ec,
                  const std::string& host,
                  const std::string& target,
                  const std::string& stage) {
    if (ec == beast::error::timeout) {
        throw makeError(host, target, stage + " timed out");
    }
    if (ec) {
        throw makeError(host, target, stage + " error: " + ec.message());
    }
}

bhttp::response<bhttp::string_body> performRequest(const HttpRequest& request,
                                                   const std::string& host,
                                                   const std::string& port,
                                                   const std::string& target) {
    if (request.timeout.count() <= 0) {
        throw makeError(host, target, "timeout must be positive");
    }
    const auto deadline = std::chrono::steady_clock::now() + request.timeout;

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    sslContext.set_default_verify_paths();
    sslContext.set_verify_mode(ssl::verify_peer);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    stream.set_verify_callback(ssl::host_name_verification(host));

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(host, target, oss.str());
    }

    // The resolver has no expiry of its own: bound it by the deadline and
    // cancel it if it is still pending.
    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    net::ip::tcp::resolver::results_type endpoints;
    bool resolved = false;
    resolver.async_resolve(host, port,
                           [&](const beast::error_code& result, net::ip::tcp::resolver::results_type found) {
                               resolved = true;
                               ec = result;
                               endpoints = std::move(found);
                           });
    ioc.run_until(deadline);
    if (!resolved) {
        resolver.cancel();
        drive(ioc);
        throw makeError(host, target, "DNS resolution timed out");
    }
    throwOnError(ec, host, target, "DNS resolution");

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_at(deadline);
    lowestLayer.async_connect(endpoints, [&ec](const beast::error_code& result, const net::ip::tcp::endpoint&) {
        ec = result;
    });
    drive(ioc);
    throwOnError(ec, host, target, "Connection");

    lowestLayer.expires_at(deadline);
    stream.async_handshake(ssl::stream_base::client, [&ec](const beast::error_code& result) { ec = result; });
    drive(ioc);
    throwOnError(ec, host, target, "TLS handshake");

    bhttp::request<bhttp::empty_body> req{bhttp::verb::get, target, 11};
    req.set(bhttp::field::host, host);
    req.set(bhttp::field::user_agent, kUserAgent);
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }

    lowestLayer.expires_at(deadline);
    bhttp::async_write(stream, req, [&ec](const beast::error_code& result, std::size_t) { ec = result; });
    drive(ioc);
    throwOnError(ec, host, target, "Write");

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> response;
    lowestLayer.expires_at(deadline);
    bhttp::async_read(stream, buffer, response, [&ec](const beast::error_code& result, std::size_t) { ec = result; });
    drive(ioc);
    throwOnError(ec, host, target, "Read");

    // The response is complete; a peer that never answers close_notify only
    // costs the rest of the deadline.
    lowestLayer.expires_at(deadline);
    stream.async_shutdown([&ec](const beast::error_code& result) { ec = result; });
    drive(ioc);
    if (ec == net::error::eof || ec == ssl::error::stream_truncated || ec == beast::error::timeout) {
        ec = {};
    }
    throwOnError(ec, host, target, "TLS shutdown");

    return response;
}

}  // namespace

HttpResponse https_get(const HttpRequest& request) {
    if (request.host.empty()) {
        throw std::runtime_error("HTTPS GET requires a non-empty host");
    }

    std::string currentHost = request.host;
    std::string currentPort = request.port.empty() ? std::string{"443"} : request.port;
    std::string currentTarget = request.target.empty() ? std::string{"/"} : request.target;
    if (currentTarget.front() != '/') {
        currentTarget.insert(currentTarget.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(request, currentHost, currentPort, currentTarget);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                const auto parsed = parseRedirectLocation(
                    std::string(response.base()[bhttp::field::location]), currentHost, currentPort);
                currentHost = parsed.host;
                currentPort = parsed.port;
                currentTarget = parsed.target;
                continue;
            } catch (const std::exception& redirectError) {
                throw makeError(currentHost, currentTarget, redirectError.what());
            }
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        if (auto it = response.base().find(bhttp::field::retry_after); it != response.base().end()) {
            result.retry_after = std::string{it->value()};
        }
        return result;
    }

    throw makeError(currentHost, currentTarget, "Too many redirects");
}

HttpTransport default_transport() {
    return [](const HttpRequest& request) { return https_get(request); };
}

std::string url_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char ch : value) {
        const auto byte = static_cast<unsigned char>(ch);
        if (std::isalnum(byte) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(kHex[byte >> 4U]);
            out.push_back(kHex[byte & 0x0FU]);
        }
    }
    return out;
}

}  // namespace infra::http
