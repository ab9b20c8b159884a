#pragma once

#include <date_mcp/core/result.hpp>
#include <date_mcp/mcp/prompt_catalog.hpp>
#include <date_mcp/mcp/tool_dispatcher.hpp>
#include <date_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace date_mcp {

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - ping
//   - tools/list, tools/call
//   - prompts/list, prompts/get
//   - notifications/* (no response)
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry registry,
              const ToolDispatcher& dispatcher,
              PromptCatalog prompts,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on stdin).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json HandlePromptsList(const nlohmann::json& id);
    nlohmann::json HandlePromptsGet(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json MakeError(const nlohmann::json& id,
                             int code, const std::string& message);
    nlohmann::json MakeError(const nlohmann::json& id, const Error& error);
    nlohmann::json MakeResult(const nlohmann::json& id,
                              const nlohmann::json& result);

    ToolRegistry registry_;
    const ToolDispatcher& dispatcher_;
    PromptCatalog prompts_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

} // namespace date_mcp
