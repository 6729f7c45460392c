#include "ragmcp/server/mcp_server.hpp"

#include <asio/co_spawn.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

namespace ragmcp {

namespace {

constexpr const char* kJsonMime = "application/json";

constexpr const char* kDocumentCollectionUri = "rag://documents/collection";
constexpr const char* kConversationHistoryUri = "rag://conversations/history";
constexpr const char* kSystemStatsUri = "rag://system/stats";
constexpr const char* kVectorstoreInfoUri = "rag://vectorstore/info";

std::string answer_text(const Json& answer) {
    if (answer.is_string()) {
        return answer.get<std::string>();
    }
    if (answer.is_object() && answer.contains("answer") && answer["answer"].is_string()) {
        return answer["answer"].get<std::string>();
    }
    return answer.dump(2);
}

std::vector<std::string> string_list(const Json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) {
        return out;
    }
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::string argument_text(const Json& args, const char* key, std::string fallback = {}) {
    if (!args.contains(key) || args[key].is_null()) {
        return fallback;
    }
    return args[key].is_string() ? args[key].get<std::string>() : args[key].dump();
}

asio::awaitable<McpResult<CallToolResult>> call_provider_tool(
    std::shared_ptr<IToolProvider> provider,
    std::string name,
    Json arguments
) {
    auto result = co_await provider->call(name, std::move(arguments));
    if (!result) {
        co_return CallToolResult::text_result("Tool execution failed: " + result.error().message, true);
    }
    const bool failed = result->is_object() && result->contains("success") &&
                        (*result)["success"].is_boolean() && !(*result)["success"].get<bool>();
    co_return CallToolResult::text_result(result->dump(2), failed);
}

ReadResourceResult json_resource(const std::string& uri, const Json& content) {
    ReadResourceResult result;
    result.contents.push_back(ResourceContents{uri, kJsonMime, content.dump(2), std::nullopt});
    return result;
}

/// Failure answered in band: the client still receives a document
ReadResourceResult failed_resource(const std::string& uri, const McpError& error) {
    auto result = json_resource(uri, Json{
        {"error", "Failed to read resource: " + error.message},
        {"code", error.code}
    });
    result.is_error = true;
    return result;
}

GetPromptResult failed_prompt(const std::string& name, const std::string& reason) {
    GetPromptResult result;
    result.description = "Failed to generate prompt " + name;
    result.messages.push_back(PromptMessage{
        "assistant", TextContent{"Prompt execution failed: " + reason}.to_json()});
    result.is_error = true;
    return result;
}

Json object_schema(Json properties, std::vector<std::string> required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════

McpServer::McpServer(
    std::unique_ptr<IAsyncTransport> transport,
    std::shared_ptr<IRagSystem> rag,
    std::shared_ptr<IToolProvider> tools,
    McpServerOptions options
)
    : transport_(std::move(transport))
    , rag_(std::move(rag))
    , tools_(std::move(tools))
    , options_(std::move(options))
    , core_(*transport_, Role::Server, options_.protocol)
    , closed_signal_(transport_->get_executor())
    , log_threshold_(options_.log_threshold)
{
    core_.set_local_identity(options_.info, advertised_capabilities().to_json(), options_.instructions);
    closed_signal_.expires_at(std::chrono::steady_clock::time_point::max());

    core_.on_closed([this](const std::string& reason) {
        running_ = false;
        RAGMCP_LOG_INFO("MCP server connection closed: " + reason);
        closed_signal_.cancel();
    });
    core_.on_ready([this] {
        const auto& client = core_.remote_info();
        RAGMCP_LOG_INFO("Client initialized: " + (client ? client->name : std::string("unknown")));
    });

    register_handlers();
    register_provider_tools();
    if (rag_) {
        register_rag_catalog();
    }

    // Construction-time registrations are part of the initial catalog
    registry_.on_list_changed([this](CatalogKind kind) { announce_list_changed(kind); });
}

McpServer::~McpServer() = default;

ServerCapabilities McpServer::advertised_capabilities() {
    return ServerCapabilities::defaults();
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<McpResult<void>> McpServer::start() {
    if (running_) {
        co_return McpResult<void>{};
    }
    if (core_.is_closed()) {
        co_return tl::unexpected(McpError::connection_error("Server connection already closed"));
    }

    RAGMCP_LOG_INFO("Starting MCP server with " + std::string(transport_->kind()) + " transport");
    auto started = co_await transport_->async_start();
    if (!started) {
        co_return tl::unexpected(McpError::from_transport(started.error(), transport_->kind()));
    }

    started_at_ = std::chrono::steady_clock::now();
    running_ = true;
    core_.start();
    RAGMCP_LOG_INFO("MCP server started");
    co_return McpResult<void>{};
}

asio::awaitable<void> McpServer::run() {
    auto started = co_await start();
    if (!started) {
        RAGMCP_LOG_ERROR("Failed to start MCP server: " + started.error().describe());
        co_return;
    }

    if (!core_.is_closed()) {
        asio::error_code ec;
        co_await closed_signal_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }
    co_await core_.wait_stopped();
    RAGMCP_LOG_INFO("MCP server stopped");
}

asio::awaitable<void> McpServer::stop() {
    RAGMCP_LOG_INFO("Stopping MCP server");
    co_await core_.close("Server stopped");
    co_await core_.wait_stopped();
    running_ = false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Outbound
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<McpResult<void>> McpServer::send_log_message(
    std::string level,
    Json data,
    std::optional<std::string> logger
) {
    const auto local = log_level_from_mcp(level);
    if (!local) {
        co_return tl::unexpected(McpError::invalid_params("Unknown log level: " + level));
    }
    if (!passes(*local, log_threshold_)) {
        co_return McpResult<void>{};
    }

    LogMessageNotification message{std::move(level), std::move(logger), std::move(data)};
    co_return co_await core_.send_notification(std::string(methods::LogMessage), message.to_json());
}

void McpServer::announce_list_changed(CatalogKind kind) {
    if (!core_.is_ready()) {
        return;
    }

    std::string method;
    switch (kind) {
        case CatalogKind::Tools:     method = methods::ToolsListChanged; break;
        case CatalogKind::Resources: method = methods::ResourcesListChanged; break;
        case CatalogKind::Prompts:   method = methods::PromptsListChanged; break;
    }

    asio::co_spawn(
        transport_->get_executor(),
        core_.send_notification(method),
        [method](std::exception_ptr ep, McpResult<void> sent) {
            if (ep) {
                RAGMCP_LOG_ERROR("Exception while sending " + method);
            } else if (!sent) {
                RAGMCP_LOG_WARN("Failed to send " + method + ": " + sent.error().message);
            }
        });
}

// ═══════════════════════════════════════════════════════════════════════════
// Status
// ═══════════════════════════════════════════════════════════════════════════

Json McpServer::status() const {
    Json j = {
        {"isRunning", running_},
        {"serverInfo", options_.info.to_json()},
        {"protocol", core_.status().to_json()},
        {"capabilities", registry_.stats().to_json()},
        {"clientInfo", nullptr}
    };
    if (const auto& client = core_.remote_info()) {
        j["clientInfo"] = client->to_json();
    }
    return j;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Method Handlers
// ═══════════════════════════════════════════════════════════════════════════

void McpServer::register_handlers() {
    auto& table = core_.handlers();

    table.on_request(std::string(methods::ToolsList),
        [this](const Json&) -> asio::awaitable<McpResult<Json>> {
            co_return descriptors_to_json(registry_.list_tools(), "tools");
        });
    table.on_request(std::string(methods::ResourcesList),
        [this](const Json&) -> asio::awaitable<McpResult<Json>> {
            co_return descriptors_to_json(registry_.list_resources(), "resources");
        });
    table.on_request(std::string(methods::PromptsList),
        [this](const Json&) -> asio::awaitable<McpResult<Json>> {
            co_return descriptors_to_json(registry_.list_prompts(), "prompts");
        });

    table.on_request(std::string(methods::ToolsCall),
        [this](const Json& params) { return handle_tools_call(params); });
    table.on_request(std::string(methods::ResourcesRead),
        [this](const Json& params) { return handle_resources_read(params); });
    table.on_request(std::string(methods::PromptsGet),
        [this](const Json& params) { return handle_prompts_get(params); });
    table.on_request(std::string(methods::LoggingSetLevel),
        [this](const Json& params) { return handle_set_level(params); });
}

asio::awaitable<McpResult<Json>> McpServer::handle_tools_call(const Json& params) {
    const std::string name = params.at("name").get<std::string>();
    Json arguments = params.contains("arguments") && params["arguments"].is_object()
        ? params["arguments"]
        : Json::object();

    const ToolEntry* entry = registry_.find_tool(name);
    if (entry == nullptr) {
        co_return tl::unexpected(McpError::tool_not_found(name));
    }
    // The registry may change while the tool runs
    ToolHandler handler = entry->handler;

    RAGMCP_LOG_DEBUG("Calling tool " + name);
    CallToolResult result;
    try {
        auto outcome = co_await handler(arguments);
        if (outcome) {
            result = std::move(*outcome);
        } else {
            result = CallToolResult::text_result("Tool execution failed: " + outcome.error().message, true);
        }
    } catch (const std::exception& e) {
        RAGMCP_LOG_ERROR("Tool execution failed: " + name + ": " + e.what());
        result = CallToolResult::text_result("Tool execution failed: " + std::string(e.what()), true);
    }
    co_return result.to_json();
}

asio::awaitable<McpResult<Json>> McpServer::handle_resources_read(const Json& params) {
    const std::string uri = params.at("uri").get<std::string>();

    const ResourceEntry* entry = registry_.find_resource(uri);
    if (entry == nullptr) {
        co_return tl::unexpected(McpError::resource_not_found(uri));
    }
    ResourceHandler handler = entry->handler;

    ReadResourceResult result;
    try {
        auto outcome = co_await handler(uri);
        if (outcome) {
            result = std::move(*outcome);
        } else if (outcome.error().is_not_found()) {
            co_return tl::unexpected(outcome.error());
        } else {
            RAGMCP_LOG_ERROR("Resource read failed: " + uri + ": " + outcome.error().message);
            result = failed_resource(uri, outcome.error());
        }
    } catch (const std::exception& e) {
        RAGMCP_LOG_ERROR("Resource read failed: " + uri + ": " + e.what());
        result = failed_resource(uri, McpError::internal_error(e.what()));
    }
    co_return result.to_json();
}

asio::awaitable<McpResult<Json>> McpServer::handle_prompts_get(const Json& params) {
    const std::string name = params.at("name").get<std::string>();
    Json arguments = params.contains("arguments") && params["arguments"].is_object()
        ? params["arguments"]
        : Json::object();

    const PromptEntry* entry = registry_.find_prompt(name);
    if (entry == nullptr) {
        co_return tl::unexpected(McpError::prompt_not_found(name));
    }
    for (const auto& arg : entry->descriptor.arguments) {
        if (arg.required && (!arguments.contains(arg.name) || arguments[arg.name].is_null())) {
            co_return tl::unexpected(McpError::invalid_params(
                "Missing required argument '" + arg.name + "' for prompt " + name));
        }
    }
    PromptHandler handler = entry->handler;

    GetPromptResult result;
    try {
        auto outcome = co_await handler(arguments);
        if (outcome) {
            result = std::move(*outcome);
        } else if (outcome.error().kind == ErrorKind::InvalidParams || outcome.error().is_not_found()) {
            co_return tl::unexpected(outcome.error());
        } else {
            RAGMCP_LOG_ERROR("Prompt execution failed: " + name + ": " + outcome.error().message);
            result = failed_prompt(name, outcome.error().message);
        }
    } catch (const std::exception& e) {
        RAGMCP_LOG_ERROR("Prompt execution failed: " + name + ": " + e.what());
        result = failed_prompt(name, e.what());
    }
    co_return result.to_json();
}

asio::awaitable<McpResult<Json>> McpServer::handle_set_level(const Json& params) {
    const std::string level = params.at("level").get<std::string>();
    const auto local = log_level_from_mcp(level);
    if (!local) {
        co_return tl::unexpected(McpError::invalid_params("Unknown log level: " + level));
    }

    log_threshold_ = *local;
    get_logger().set_level(*local);
    RAGMCP_LOG_INFO("Logging level set to: " + level);
    co_return Json{{"success", true}};
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Catalog
// ═══════════════════════════════════════════════════════════════════════════

void McpServer::register_provider_tools() {
    if (!tools_) {
        return;
    }
    for (auto tool : tools_->list()) {
        if (!tool.description) {
            tool.description = "";
        }
        const std::string name = tool.name;
        auto registered = registry_.register_tool(std::move(tool),
            [provider = tools_, name](const Json& args) {
                return call_provider_tool(provider, name, args);
            });
        if (!registered) {
            RAGMCP_LOG_WARN("Skipping provider tool " + name + ": " + registered.error().message);
        }
    }
}

void McpServer::register_rag_catalog() {
    // ─────────────────────────────────────────────────────────────────────────
    // Tools
    // ─────────────────────────────────────────────────────────────────────────

    Tool query{
        "rag_query",
        "Query the RAG system with a question to get an answer based on indexed documents",
        object_schema({
            {"question", {{"type", "string"}, {"description", "The question to ask the RAG system"}}},
            {"mode", {
                {"type", "string"},
                {"enum", {"simple", "conversational", "with_tools"}},
                {"description", "Query mode: simple (basic RAG), conversational (with chat history), "
                                "or with_tools (tool-enabled)"},
                {"default", "simple"}
            }},
            {"threadId", {
                {"type", "string"},
                {"description", "Thread ID for conversational mode"},
                {"default", "default"}
            }}
        }, {"question"})
    };

    Tool index{
        "rag_index_documents",
        "Index new documents into the RAG system",
        object_schema({
            {"sources", {
                {"type", "object"},
                {"properties", {
                    {"urls", {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", "URLs to index"}}},
                    {"localFiles", {{"type", "array"}, {"items", {{"type", "string"}}},
                                    {"description", "Local file paths to index"}}}
                }},
                {"description", "Document sources to index"}
            }}
        }, {"sources"})
    };

    Tool status{"rag_status", "Get the current status of the RAG system", object_schema(Json::object(), {})};

    const auto check = [](const McpResult<void>& registered) {
        if (!registered) {
            RAGMCP_LOG_ERROR("Failed to register RAG capability: " + registered.error().message);
        }
    };

    check(registry_.register_tool(std::move(query), [this](const Json& a) { return rag_query(a); }));
    check(registry_.register_tool(std::move(index), [this](const Json& a) { return rag_index_documents(a); }));
    check(registry_.register_tool(std::move(status), [this](const Json& a) { return rag_status(a); }));

    // ─────────────────────────────────────────────────────────────────────────
    // Resources
    // ─────────────────────────────────────────────────────────────────────────

    struct ResourceSpec {
        const char* uri;
        const char* name;
        const char* description;
        asio::awaitable<McpResult<Json>> (IRagSystem::*read)();
    };
    const ResourceSpec resources[] = {
        {kDocumentCollectionUri, "Document Collection",
         "Access to the indexed document collection in the RAG system", &IRagSystem::document_collection},
        {kConversationHistoryUri, "Conversation History",
         "Access to conversation history and chat threads", &IRagSystem::conversation_history},
        {kSystemStatsUri, "System Statistics",
         "RAG system statistics and performance metrics", &IRagSystem::system_stats},
        {kVectorstoreInfoUri, "Vector Store Info",
         "Information about the vector store and embeddings", &IRagSystem::vectorstore_info},
    };

    for (const auto& entry : resources) {
        const bool is_stats = std::string_view(entry.uri) == kSystemStatsUri;
        check(registry_.register_resource(
            Resource{entry.uri, entry.name, entry.description, kJsonMime},
            [this, read = entry.read, is_stats](const std::string& uri)
                -> asio::awaitable<McpResult<ReadResourceResult>> {
                auto content = co_await ((*rag_).*read)();
                if (!content) {
                    co_return failed_resource(uri, content.error());
                }
                Json document = std::move(*content);
                if (is_stats && document.is_object()) {
                    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::steady_clock::now() - started_at_);
                    document["serverInfo"] = {
                        {"name", options_.info.name},
                        {"version", options_.info.version},
                        {"uptimeSeconds", running_ ? uptime.count() : 0}
                    };
                }
                co_return json_resource(uri, document);
            }));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Prompts
    // ─────────────────────────────────────────────────────────────────────────

    const PromptArgument question{"question", "The question to ask", true};

    const auto user_prompt = [](std::string name, std::string text) {
        GetPromptResult result;
        result.description = "Generated prompt for " + name;
        result.messages.push_back(PromptMessage{"user", TextContent{std::move(text)}.to_json()});
        return result;
    };

    check(registry_.register_prompt(
        Prompt{"rag_query_simple", "Simple RAG query prompt template", {question}},
        [user_prompt](const Json& args) -> asio::awaitable<McpResult<GetPromptResult>> {
            co_return user_prompt("rag_query_simple",
                "Please answer the following question using the RAG system: " +
                argument_text(args, "question"));
        }));

    check(registry_.register_prompt(
        Prompt{"rag_query_conversational", "Conversational RAG query with context",
               {question, PromptArgument{"threadId", "Conversation thread ID", false}}},
        [user_prompt](const Json& args) -> asio::awaitable<McpResult<GetPromptResult>> {
            co_return user_prompt("rag_query_conversational",
                "Continue our conversation in thread \"" + argument_text(args, "threadId", "default") +
                "\". Question: " + argument_text(args, "question"));
        }));

    check(registry_.register_prompt(
        Prompt{"rag_query_with_tools", "RAG query with tool execution support", {question}},
        [user_prompt](const Json& args) -> asio::awaitable<McpResult<GetPromptResult>> {
            co_return user_prompt("rag_query_with_tools",
                "Answer this question using the RAG system and any necessary tools: " +
                argument_text(args, "question"));
        }));
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: RAG Tools
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<McpResult<CallToolResult>> McpServer::rag_query(const Json& args) {
    if (!args.contains("question") || !args["question"].is_string()) {
        co_return CallToolResult::text_result("RAG query failed: question must be a string", true);
    }
    std::string question = args["question"].get<std::string>();

    const std::string mode_name = argument_text(args, "mode", "simple");
    const auto mode = query_mode_from_string(mode_name);
    if (!mode) {
        co_return CallToolResult::text_result("RAG query failed: Invalid query mode: " + mode_name, true);
    }
    std::string thread_id = argument_text(args, "threadId", "default");

    auto answer = co_await rag_->query(std::move(question), *mode, std::move(thread_id));
    if (!answer) {
        RAGMCP_LOG_ERROR("RAG query failed: " + answer.error().message);
        co_return CallToolResult::text_result("RAG query failed: " + answer.error().message, true);
    }
    co_return CallToolResult::text_result(answer_text(*answer));
}

asio::awaitable<McpResult<CallToolResult>> McpServer::rag_index_documents(const Json& args) {
    if (!args.contains("sources") || !args["sources"].is_object()) {
        co_return CallToolResult::text_result("Document indexing failed: sources must be an object", true);
    }
    const Json& sources = args["sources"];

    auto summary = co_await rag_->index_documents(string_list(sources, "urls"),
                                                  string_list(sources, "localFiles"));
    if (!summary) {
        RAGMCP_LOG_ERROR("Document indexing failed: " + summary.error().message);
        co_return CallToolResult::text_result("Document indexing failed: " + summary.error().message, true);
    }
    co_return CallToolResult::text_result(
        "Documents indexed successfully: " + std::to_string(summary->documents_loaded) +
        " documents, " + std::to_string(summary->unique_chunks) + " unique chunks");
}

asio::awaitable<McpResult<CallToolResult>> McpServer::rag_status(const Json& /*args*/) {
    auto status = co_await rag_->status();
    if (!status) {
        RAGMCP_LOG_ERROR("Failed to get RAG status: " + status.error().message);
        co_return CallToolResult::text_result("Failed to get RAG status: " + status.error().message, true);
    }
    co_return CallToolResult::text_result(status->dump(2));
}

}  // namespace ragmcp
