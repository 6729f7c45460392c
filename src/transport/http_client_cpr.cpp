#include "ragmcp/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <atomic>
#include <cstdint>

namespace ragmcp {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (C++ Requests) over libcurl. The base URL is the full endpoint
// ("http://host:port/mcp"); paths are appended verbatim and are normally
// empty.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_base_url(const std::string& url) override {
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> get(
        const std::string& path,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }
        auto response = cpr::Get(
            cpr::Url{*url},
            build_headers(headers),
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }
        auto request_headers = build_headers(headers);
        request_headers["Content-Type"] = content_type;

        auto response = cpr::Post(
            cpr::Url{*url},
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> del(
        const std::string& path,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }
        auto response = cpr::Delete(
            cpr::Url{*url},
            build_headers(headers),
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> stream_get(
        const std::string& path,
        const HeaderMap& headers,
        StreamCallback on_data
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }
        auto request_headers = build_headers(headers);
        request_headers["Accept"] = "text/event-stream";

        bool stopped_by_callback = false;

        // libcurl calls the progress callback about once per second even
        // while idle, which is where an otherwise silent stream notices cancel().
        auto response = cpr::Get(
            cpr::Url{*url},
            request_headers,
            cpr::ConnectTimeout{connect_timeout_},
            cpr::VerifySsl{verify_ssl_},
            cpr::WriteCallback{[this, &on_data, &stopped_by_callback](auto data, std::intptr_t) -> bool {
                if (cancelled_.load()) {
                    return false;
                }
                const bool keep_going = on_data(std::string_view(data));
                stopped_by_callback = !keep_going;
                return keep_going;
            }},
            cpr::ProgressCallback{[this](auto, auto, auto, auto, std::intptr_t) -> bool {
                return cancelled_.load() == false;
            }}
        );

        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        // Stopping from the write callback surfaces as a curl write error
        if (response.error.code != cpr::ErrorCode::OK && !stopped_by_callback) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    void cancel() override {
        cancelled_.store(true);
    }

    void reset() override {
        cancelled_.store(false);
    }

private:
    HttpClientResult<std::string> build_url(const std::string& path) const {
        if (cancelled_.load()) {
            return tl::unexpected(HttpClientError::cancelled());
        }
        for (unsigned char c : path) {
            if (c < 0x20 || c == 0x7F) {
                return tl::unexpected(HttpClientError::unknown("Path contains control characters"));
            }
        }
        if (base_url_.empty()) {
            return tl::unexpected(HttpClientError::unknown("No URL configured"));
        }
        return base_url_ + path;
    }

    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) const {
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);
        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout("Request timed out: " + msg);
            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);
            default:
                // refused / reset / host not found
                return HttpClientError::connection_failed(msg);
        }
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{true};

    std::atomic<bool> cancelled_{false};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace ragmcp
