#include <date_mcp/mcp/prompt_catalog.hpp>

#include <utility>

namespace date_mcp {

namespace {

constexpr const char* kDateSummary = "date-summary";

constexpr const char* kDateSummaryText =
    "Please give me a short summary of today: the current date in ISO 8601 "
    "format, the current local time, and the day of the week. Use the "
    "get_iso_date, current_time and get_day_name tools.";

nlohmann::json UserMessage(const std::string& text) {
    return {{"role", "user"},
            {"content", {{"type", "text"}, {"text", text}}}};
}

} // anonymous namespace

PromptCatalog::PromptCatalog() {
    prompts_.push_back({kDateSummary,
                        "Summarize the current date, time and weekday",
                        nlohmann::json::array()});
}

Result<nlohmann::json, Error> PromptCatalog::Get(const std::string& name) const {
    if (name != kDateSummary) {
        return Result<nlohmann::json, Error>::Err(Error{
            "prompts/get", "Unknown prompt: " + name,
            ErrorCategory::UnknownPrompt, {}});
    }

    nlohmann::json result = {
        {"description", prompts_.front().description},
        {"messages", nlohmann::json::array({UserMessage(kDateSummaryText)})}};
    return Result<nlohmann::json, Error>::Ok(std::move(result));
}

} // namespace date_mcp
