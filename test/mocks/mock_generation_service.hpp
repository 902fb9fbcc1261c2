#pragma once

#include <gemini_mcp/gemini/i_generation_service.hpp>

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace gemini_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockGenerationService: hand-written mock for offline unit testing.
//
// Usage:
//   MockGenerationService mock;
//   mock.EnqueueText("1. First idea\n2. Second idea");
//   auto result = ExecuteBrainstorm(mock, input);
//   CHECK(mock.CallCount() == 1);
//   CHECK(mock.Calls()[0].model == ModelVariant::Pro);
//
// Responses are consumed FIFO. If the queue is empty when Generate() is
// called, the mock returns a descriptive error rather than crashing.
// ---------------------------------------------------------------------------

struct GenerateCall {
    std::string prompt;
    ModelVariant model;
    std::optional<GenerationConfig> config;
};

class MockGenerationService : public IGenerationService {
public:
    MockGenerationService() = default;

    // -- Enqueue canned responses -------------------------------------------

    void Enqueue(Result<GenerationResponse, Error> response) {
        responses_.push_back(std::move(response));
    }

    void EnqueueText(const std::string& text, UsageMetadata usage = {10, 20, 30}) {
        Enqueue(Result<GenerationResponse, Error>::Ok(GenerationResponse{text, usage}));
    }

    void EnqueueError(ErrorCategory category, const std::string& message,
                      std::optional<int> http_status = std::nullopt) {
        Enqueue(Result<GenerationResponse, Error>::Err(
            Error{"GenerateContent", message, http_status, std::nullopt, category}));
    }

    // -- Call history accessors ----------------------------------------------

    [[nodiscard]] const std::vector<GenerateCall>& Calls() const noexcept {
        return calls_;
    }
    [[nodiscard]] size_t CallCount() const noexcept {
        return calls_.size();
    }

    void Reset() {
        responses_.clear();
        calls_.clear();
    }

    // -- IGenerationService implementation -----------------------------------

    Result<GenerationResponse, Error> Generate(
        std::string_view prompt,
        ModelVariant model,
        const std::optional<GenerationConfig>& config) override {
        calls_.push_back({std::string(prompt), model, config});
        if (responses_.empty()) {
            return Result<GenerationResponse, Error>::Err(Error{
                "GenerateContent", "MockGenerationService: no responses enqueued",
                std::nullopt, std::nullopt, ErrorCategory::Internal});
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

    [[nodiscard]] std::string ModelId(ModelVariant model) const override {
        return model == ModelVariant::Flash ? "mock-flash" : "mock-pro";
    }

private:
    std::deque<Result<GenerationResponse, Error>> responses_;
    std::vector<GenerateCall> calls_;
};

} // namespace testing
} // namespace gemini_mcp
