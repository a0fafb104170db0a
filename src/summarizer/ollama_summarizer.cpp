#include "summarizer/summarizer.h"

#include <spdlog/spdlog.h>
#include <utility>

#include "utils/config.h"

namespace cqr {

namespace {

std::string trim(const std::string& s) {
    auto a = s.find_first_not_of(" \t\r\n");
    auto b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    return s.substr(a, b - a + 1);
}

SummaryResult failure(std::string message) {
    return SummaryResult{false, "", std::move(message)};
}

}  // namespace

std::string buildSummaryPrompt(const std::string& raw_payload) {
    std::string prompt;
    prompt.reserve(raw_payload.size() + 256);
    prompt.append("You are summarizing real Kubernetes ops tool output.\n");
    prompt.append("Use only the provided tool result.\n");
    prompt.append("Do not invent facts.\n");
    prompt.append("If the tool result is empty, say that clearly.\n");
    prompt.append("Return exactly 3 short bullet points.\n\n");
    prompt.append("Tool result:\n");
    prompt.append(raw_payload);
    prompt.append("\n");
    return prompt;
}

SummaryRequest SummaryRequest::forToolResult(const std::string& model, const ToolResult& result) {
    return SummaryRequest{model, buildSummaryPrompt(result.payload)};
}

nlohmann::json SummaryRequest::toJson() const {
    return {{"model", model}, {"prompt", prompt}, {"stream", false}};
}

OllamaSummarizer::OllamaSummarizer(const std::string& base_url, std::string model, std::chrono::milliseconds timeout)
    : base_(parseUrl(base_url)), model_(std::move(model)), timeout_(timeout) {}

OllamaSummarizer::OllamaSummarizer(const RouterConfig& config)
    : OllamaSummarizer(config.ollama_url, config.ollama_model, config.model_timeout) {}

SummaryResult OllamaSummarizer::parseGenerateResponse(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return failure("model returned a non-JSON response");
    }
    if (j.contains("error")) {
        return failure("model error: " + (j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump()));
    }
    if (!j.contains("response") || !j["response"].is_string()) {
        return failure("model response has no 'response' text");
    }
    std::string text = trim(j["response"].get<std::string>());
    if (text.empty()) {
        return failure("model returned an empty summary");
    }
    return SummaryResult{true, std::move(text), ""};
}

SummaryResult OllamaSummarizer::summarize(const ToolResult& result) {
    if (trim(result.payload).empty()) {
        return SummaryResult{true, kEmptyToolOutputSummary, ""};
    }

    auto client = makeClient(base_, timeout_);
    if (!client) {
        return failure("invalid or unsupported model endpoint");
    }

    const SummaryRequest request = SummaryRequest::forToolResult(model_, result);
    const std::string path = joinUrlPath(base_, "/api/generate");
    spdlog::debug("Summarizing {} bytes of {} output with {}", result.payload.size(),
                  to_string(result.backend), model_);

    auto res = client->Post(path, request.toJson().dump(), "application/json");
    if (!res) {
        return failure("model request to " + base_.schemeHostPort() + path + " failed: " +
                       describeHttpError(res.error()));
    }
    if (res->status != 200) {
        std::string message = "model returned HTTP " + std::to_string(res->status);
        if (!res->body.empty()) message += ": " + res->body;
        return failure(message);
    }
    return parseGenerateResponse(res->body);
}

}  // namespace cqr
