#pragma once

#include <date_mcp/core/result.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace date_mcp {

struct PromptSchema {
    std::string name;
    std::string description;
    nlohmann::json arguments;  // array of {name, description, required}
};

// ---------------------------------------------------------------------------
// PromptCatalog — fixed prompt templates served by prompts/list and
// prompts/get. Currently a single "date-summary" prompt with no arguments.
// ---------------------------------------------------------------------------
class PromptCatalog {
public:
    PromptCatalog();

    [[nodiscard]] const std::vector<PromptSchema>& Prompts() const noexcept {
        return prompts_;
    }

    // prompts/get result: {description, messages}. Fails with UnknownPrompt.
    [[nodiscard]] Result<nlohmann::json, Error> Get(const std::string& name) const;

private:
    std::vector<PromptSchema> prompts_;
};

} // namespace date_mcp
