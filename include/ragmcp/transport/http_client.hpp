#pragma once

#include "ragmcp/transport.hpp"

#include <tl/expected.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace ragmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230.

inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = std::ranges::find_if(headers, [&name](const auto& pair) {
        return std::ranges::equal(pair.first, name, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    });
    if (it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,  // refused, reset, DNS failure
        Timeout,
        SslError,
        Cancelled,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError cancelled() {
        return {Code::Cancelled, "Request cancelled"};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }

    /// Byte-layer view of this failure
    [[nodiscard]] TransportError to_transport_error() const {
        switch (code) {
            case Code::Timeout:
                return {TransportError::Category::Timeout, message, std::nullopt};
            case Code::Cancelled:
                return TransportError::closed(message);
            default:
                return {TransportError::Category::Network, message, std::nullopt};
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_sse() const {
        const auto content_type = get_header(headers, "Content-Type");
        return content_type.has_value() &&
               content_type->find("text/event-stream") != std::string::npos;
    }

    [[nodiscard]] bool is_json() const {
        const auto content_type = get_header(headers, "Content-Type");
        return content_type.has_value() &&
               content_type->find("application/json") != std::string::npos;
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

/// Receives body bytes of a streaming GET. Return false to stop the stream.
using StreamCallback = std::function<bool(std::string_view chunk)>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// Blocking HTTP calls. Callers that live on an event loop run them on a
// worker pool. Tests substitute a mock.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual void set_base_url(const std::string& url) = 0;
    virtual void set_default_headers(const HeaderMap& headers) = 0;
    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    /// Whole-request deadline for get/post/del (0 = none)
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;
    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> get(
        const std::string& path,
        const HeaderMap& headers = {}
    ) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers = {}
    ) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> del(
        const std::string& path,
        const HeaderMap& headers = {}
    ) = 0;

    /// Long-lived GET without a read deadline; body bytes go to on_data as
    /// they arrive. Returns when the server ends the stream, on_data returns
    /// false, or cancel() is called. The response carries status and headers
    /// but no body.
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> stream_get(
        const std::string& path,
        const HeaderMap& headers,
        StreamCallback on_data
    ) = 0;

    /// Refuse new requests and abort running streams
    virtual void cancel() = 0;

    /// Allow requests again after cancel()
    virtual void reset() = 0;
};

/// Default implementation (cpr)
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace ragmcp
