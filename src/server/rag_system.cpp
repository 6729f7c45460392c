#include "ragmcp/server/rag_system.hpp"

namespace ragmcp {

std::string_view to_string(QueryMode mode) noexcept {
    switch (mode) {
        case QueryMode::Simple:         return "simple";
        case QueryMode::Conversational: return "conversational";
        case QueryMode::WithTools:      return "with_tools";
    }
    return "unknown";
}

std::optional<QueryMode> query_mode_from_string(std::string_view name) noexcept {
    if (name == "simple")         return QueryMode::Simple;
    if (name == "conversational") return QueryMode::Conversational;
    if (name == "with_tools")     return QueryMode::WithTools;
    return std::nullopt;
}

}  // namespace ragmcp
