#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Shared types used by all transport implementations.
//
// Transports move opaque byte payloads (one JSON-RPC envelope each). They
// never interpret the content; decoding belongs to the protocol layer.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <tl/expected.hpp>

namespace ragmcp {

using Json = nlohmann::json;
using HeaderMap = std::unordered_map<std::string, std::string>;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Network,   // I/O failure, connection refused/reset, process spawn failure
        Timeout,   // Operation exceeded its deadline
        Protocol,  // Framing violation (oversized line, bad HTTP status)
        Closed     // Peer or local side closed the stream (EOF)
    };

    Category category{};
    std::string message;
    std::optional<int> status_code{};

    /// Connection-level failures and HTTP errors are worth retrying.
    [[nodiscard]] bool is_retryable() const noexcept {
        return category == Category::Network || category == Category::Timeout ||
               (category == Category::Protocol && status_code.has_value());
    }

    [[nodiscard]] static TransportError closed(std::string msg = "Transport closed") {
        return {Category::Closed, std::move(msg), std::nullopt};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "network";
        case TransportError::Category::Timeout:  return "timeout";
        case TransportError::Category::Protocol: return "protocol";
        case TransportError::Category::Closed:   return "closed";
    }
    return "unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace ragmcp
