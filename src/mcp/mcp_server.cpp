#include <date_mcp/mcp/mcp_server.hpp>

#include <date_mcp/core/log.hpp>
#include <date_mcp/core/version.hpp>

#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace date_mcp {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

// JSON-RPC 2.0 error codes.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

int JsonRpcCode(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::UnknownTool:
        case ErrorCategory::InvalidArgument:
        case ErrorCategory::LocationNotFound:
        case ErrorCategory::UnknownPrompt:
            return kInvalidParams;
        case ErrorCategory::Config:
        case ErrorCategory::TimezoneUnavailable:
        case ErrorCategory::Internal:
            return kInternalError;
    }
    return kInternalError;
}

// Invalid UTF-8 in strings is replaced with U+FFFD instead of throwing.
std::string Serialize(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     const ToolDispatcher& dispatcher,
                     PromptCatalog prompts,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)),
      dispatcher_(dispatcher),
      prompts_(std::move(prompts)),
      in_(in),
      out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "server ready on stdio");

    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty() || line == "\r") continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn("mcp", std::string("unparseable message: ") + e.what());
            auto err = MakeError(nullptr, kParseError, "Parse error");
            out_ << Serialize(err) << "\n";
            out_.flush();
            continue;
        }

        std::string reply;
        try {
            auto response = HandleMessage(message);
            if (!response) continue;
            reply = Serialize(*response);
        } catch (const std::exception& e) {
            LogError("mcp", std::string("request failed: ") + e.what());
            nlohmann::json id = nullptr;
            if (message.is_object() && message.contains("id")) {
                id = message["id"];
            }
            reply = Serialize(MakeError(id, kInternalError, "Internal error"));
        }
        out_ << reply << "\n";
        out_.flush();
    }

    LogInfo("mcp", "stdin closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Request must be a JSON object");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], kInvalidRequest,
                             "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    const bool is_notification = !message.contains("id");
    std::string method;
    if (message.contains("method") && message["method"].is_string()) {
        method = message["method"].get<std::string>();
    }
    nlohmann::json params = nlohmann::json::object();
    if (message.contains("params") && message["params"].is_object()) {
        params = message["params"];
    }

    if (is_notification) {
        LogDebug("mcp", "notification " + method);
        return std::nullopt;
    }

    const auto& id = message["id"];
    LogDebug("mcp", "request " + method);
    if (!initialized_ && method != "initialize") {
        LogWarn("mcp", "'" + method + "' received before initialize");
    }

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "prompts/list") {
        return HandlePromptsList(id);
    } else if (method == "prompts/get") {
        return HandlePromptsGet(params, id);
    } else {
        return MakeError(id, kMethodNotFound, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LogInfo("mcp", "client connected: " +
                           params["clientInfo"].value("name", std::string("unknown")));
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()},
        {"prompts", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "date-mcp"},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    auto result = dispatcher_.Dispatch(tool_name, arguments);
    if (result.IsErr()) {
        return MakeError(id, result.Error());
    }

    return MakeResult(id, {{"content", result.Value().content}});
}

nlohmann::json McpServer::HandlePromptsList(const nlohmann::json& id) {
    nlohmann::json prompts = nlohmann::json::array();

    for (const auto& prompt : prompts_.Prompts()) {
        prompts.push_back({
            {"name", prompt.name},
            {"description", prompt.description},
            {"arguments", prompt.arguments}
        });
    }

    return MakeResult(id, {{"prompts", prompts}});
}

nlohmann::json McpServer::HandlePromptsGet(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    auto result = prompts_.Get(params["name"].get<std::string>());
    if (result.IsErr()) {
        return MakeError(id, result.Error());
    }

    return MakeResult(id, result.Value());
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeError(const nlohmann::json& id,
                                    const Error& error) {
    LogWarn("mcp", error.ToString());

    nlohmann::json data = {
        {"category", error.CategoryName()},
        {"operation", error.operation}
    };
    if (error.category == ErrorCategory::LocationNotFound) {
        data["known_locations"] = error.suggestions;
    }

    auto response = MakeError(id, JsonRpcCode(error.category), error.message);
    response["error"]["data"] = std::move(data);
    return response;
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace date_mcp
