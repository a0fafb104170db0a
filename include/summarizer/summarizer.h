#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "core/ask_types.h"
#include "utils/http_url.h"

namespace cqr {

struct RouterConfig;

/// Summary used for empty tool output; the model is not consulted.
inline constexpr const char* kEmptyToolOutputSummary = "The tool returned no data.";

// Fixed summarization prompt around the raw tool payload.
std::string buildSummaryPrompt(const std::string& raw_payload);

/// Everything the model receives: a model id and a prompt. It carries no
/// tools, tool choice or function schemas.
struct SummaryRequest {
    std::string model;
    std::string prompt;

    static SummaryRequest forToolResult(const std::string& model, const ToolResult& result);

    /// Ollama /api/generate body (non-streaming).
    nlohmann::json toJson() const;
};

class Summarizer {
public:
    virtual ~Summarizer() = default;

    /// Only called with the output of a successful tool call.
    virtual SummaryResult summarize(const ToolResult& result) = 0;
};

/// Summarizer backed by a local Ollama instance.
class OllamaSummarizer : public Summarizer {
public:
    OllamaSummarizer(const std::string& base_url, std::string model, std::chrono::milliseconds timeout);
    explicit OllamaSummarizer(const RouterConfig& config);

    SummaryResult summarize(const ToolResult& result) override;

    /// Summary text from an /api/generate response body.
    static SummaryResult parseGenerateResponse(const std::string& body);

    const std::string& model() const { return model_; }

private:
    HttpUrl base_;
    std::string model_;
    std::chrono::milliseconds timeout_;
};

}  // namespace cqr
