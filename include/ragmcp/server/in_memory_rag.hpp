#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// In-Memory Retrieval System
// ═══════════════════════════════════════════════════════════════════════════
// A self-contained IRagSystem for demos and tests. Local files are read and
// split into paragraph chunks; URLs are recorded as sources without being
// fetched. Queries rank chunks by shared words with the question and answer
// with the best one. Conversational queries are kept per thread.

#include "ragmcp/server/rag_system.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ragmcp {

class InMemoryRagSystem final : public IRagSystem {
public:
    struct Options {
        std::size_t max_chunk_size{1000};
        std::size_t max_history_per_thread{50};
    };

    InMemoryRagSystem();
    explicit InMemoryRagSystem(Options options);

    /// Index text directly (source is any label, e.g. a path)
    IndexSummary add_text(const std::string& source, const std::string& text);

    [[nodiscard]] asio::awaitable<McpResult<Json>> query(
        std::string question,
        QueryMode mode,
        std::string thread_id
    ) override;

    [[nodiscard]] asio::awaitable<McpResult<IndexSummary>> index_documents(
        std::vector<std::string> urls,
        std::vector<std::string> local_files
    ) override;

    [[nodiscard]] asio::awaitable<McpResult<Json>> status() override;
    [[nodiscard]] asio::awaitable<McpResult<Json>> document_collection() override;
    [[nodiscard]] asio::awaitable<McpResult<Json>> conversation_history() override;
    [[nodiscard]] asio::awaitable<McpResult<Json>> system_stats() override;
    [[nodiscard]] asio::awaitable<McpResult<Json>> vectorstore_info() override;

    [[nodiscard]] std::size_t chunk_count() const noexcept { return chunks_.size(); }

private:
    struct Chunk {
        std::string source;
        std::string text;
    };

    struct Turn {
        std::string question;
        std::string answer;
        std::chrono::system_clock::time_point at;
    };

    [[nodiscard]] std::vector<std::string> split_chunks(const std::string& text) const;
    [[nodiscard]] const Chunk* best_match(const std::string& question) const;

    Options options_;
    std::vector<Chunk> chunks_;
    std::set<std::string> chunk_texts_;
    std::map<std::string, std::size_t> sources_;  // source -> chunk count
    std::map<std::string, std::vector<Turn>> threads_;
    std::size_t queries_{0};
    std::chrono::steady_clock::time_point created_at_;
};

}  // namespace ragmcp
