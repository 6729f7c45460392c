#include "ragmcp/server/in_memory_rag.hpp"
#include "ragmcp/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ragmcp {

namespace {

std::set<std::string> words_of(const std::string& text) {
    std::set<std::string> words;
    std::string current;
    for (char ch : text) {
        if (std::isalnum(static_cast<unsigned char>(ch))) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        } else if (!current.empty()) {
            words.insert(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.insert(std::move(current));
    }
    return words;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

InMemoryRagSystem::InMemoryRagSystem()
    : InMemoryRagSystem(Options{})
{}

InMemoryRagSystem::InMemoryRagSystem(Options options)
    : options_(options)
    , created_at_(std::chrono::steady_clock::now())
{
    if (options_.max_chunk_size == 0) {
        options_.max_chunk_size = 1000;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Indexing
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::string> InMemoryRagSystem::split_chunks(const std::string& text) const {
    // Paragraphs (blank-line separated) packed up to max_chunk_size; longer
    // paragraphs are cut hard
    std::vector<std::string> chunks;
    std::string current;
    const auto flush = [&] {
        auto t = trim(current);
        if (!t.empty()) {
            chunks.push_back(std::move(t));
        }
        current.clear();
    };

    std::istringstream in(text);
    std::string line;
    std::string paragraph;
    const auto take_paragraph = [&] {
        auto p = trim(paragraph);
        paragraph.clear();
        if (p.empty()) {
            return;
        }
        if (!current.empty() && current.size() + p.size() + 2 > options_.max_chunk_size) {
            flush();
        }
        while (p.size() > options_.max_chunk_size) {
            chunks.push_back(p.substr(0, options_.max_chunk_size));
            p.erase(0, options_.max_chunk_size);
        }
        if (!current.empty()) {
            current += "\n\n";
        }
        current += p;
    };

    while (std::getline(in, line)) {
        if (trim(line).empty()) {
            take_paragraph();
        } else {
            paragraph += line;
            paragraph += '\n';
        }
    }
    take_paragraph();
    flush();
    return chunks;
}

IndexSummary InMemoryRagSystem::add_text(const std::string& source, const std::string& text) {
    IndexSummary summary{1, 0};
    std::size_t count = 0;
    for (auto& chunk : split_chunks(text)) {
        ++count;
        if (chunk_texts_.insert(chunk).second) {
            chunks_.push_back(Chunk{source, std::move(chunk)});
            ++summary.unique_chunks;
        }
    }
    sources_[source] += count;
    return summary;
}

asio::awaitable<McpResult<IndexSummary>> InMemoryRagSystem::index_documents(
    std::vector<std::string> urls,
    std::vector<std::string> local_files
) {
    if (urls.empty() && local_files.empty()) {
        co_return tl::unexpected(McpError::invalid_params("No document sources given"));
    }

    IndexSummary total;
    for (const auto& path : local_files) {
        std::ifstream in(path);
        if (!in) {
            co_return tl::unexpected(McpError::request_failed("Cannot read file: " + path));
        }
        std::stringstream contents;
        contents << in.rdbuf();
        const auto added = add_text(path, contents.str());
        total.documents_loaded += added.documents_loaded;
        total.unique_chunks += added.unique_chunks;
    }
    for (const auto& url : urls) {
        // Recorded by address only
        sources_.try_emplace(url, 0);
        ++total.documents_loaded;
    }

    RAGMCP_LOG_INFO("Indexed " + std::to_string(total.documents_loaded) + " documents, " +
                    std::to_string(total.unique_chunks) + " new chunks");
    co_return total;
}

// ─────────────────────────────────────────────────────────────────────────────
// Query
// ─────────────────────────────────────────────────────────────────────────────

const InMemoryRagSystem::Chunk* InMemoryRagSystem::best_match(const std::string& question) const {
    const auto wanted = words_of(question);
    const Chunk* best = nullptr;
    std::size_t best_score = 0;
    for (const auto& chunk : chunks_) {
        const auto have = words_of(chunk.text);
        const auto score = static_cast<std::size_t>(std::count_if(
            wanted.begin(), wanted.end(), [&](const std::string& w) { return have.contains(w); }));
        if (score > best_score) {
            best_score = score;
            best = &chunk;
        }
    }
    return best;
}

asio::awaitable<McpResult<Json>> InMemoryRagSystem::query(
    std::string question,
    QueryMode mode,
    std::string thread_id
) {
    if (trim(question).empty()) {
        co_return tl::unexpected(McpError::invalid_params("Question must not be empty"));
    }
    ++queries_;

    const Chunk* match = best_match(question);
    const std::string answer = match
        ? match->text
        : "No relevant documents found for: " + question;

    Json result = {
        {"answer", answer},
        {"mode", std::string(to_string(mode))},
        {"sources", match ? Json::array({match->source}) : Json::array()}
    };

    if (mode == QueryMode::Conversational) {
        const std::string thread = thread_id.empty() ? "default" : thread_id;
        auto& turns = threads_[thread];
        turns.push_back(Turn{question, answer, std::chrono::system_clock::now()});
        if (turns.size() > options_.max_history_per_thread) {
            turns.erase(turns.begin());
        }
        result["threadId"] = thread;
    }
    co_return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Introspection
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<McpResult<Json>> InMemoryRagSystem::status() {
    co_return Json{
        {"initialized", true},
        {"hasVectorStore", !chunks_.empty()},
        {"documentCount", sources_.size()},
        {"chunkCount", chunks_.size()},
        {"threadCount", threads_.size()}
    };
}

asio::awaitable<McpResult<Json>> InMemoryRagSystem::document_collection() {
    Json documents = Json::array();
    for (const auto& [source, count] : sources_) {
        documents.push_back({{"source", source}, {"chunks", count}});
    }
    co_return Json{{"totalDocuments", sources_.size()}, {"documents", std::move(documents)}};
}

asio::awaitable<McpResult<Json>> InMemoryRagSystem::conversation_history() {
    Json threads = Json::object();
    for (const auto& [id, turns] : threads_) {
        Json list = Json::array();
        for (const auto& turn : turns) {
            list.push_back({{"question", turn.question}, {"answer", turn.answer}});
        }
        threads[id] = std::move(list);
    }
    co_return Json{{"threadCount", threads_.size()}, {"threads", std::move(threads)}};
}

asio::awaitable<McpResult<Json>> InMemoryRagSystem::system_stats() {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - created_at_);
    co_return Json{
        {"queries", queries_},
        {"documents", sources_.size()},
        {"chunks", chunks_.size()},
        {"ragUptimeSeconds", uptime.count()}
    };
}

asio::awaitable<McpResult<Json>> InMemoryRagSystem::vectorstore_info() {
    std::size_t bytes = 0;
    for (const auto& chunk : chunks_) {
        bytes += chunk.text.size();
    }
    co_return Json{
        {"type", "in-memory"},
        {"chunks", chunks_.size()},
        {"bytes", bytes},
        {"maxChunkSize", options_.max_chunk_size}
    };
}

}  // namespace ragmcp
