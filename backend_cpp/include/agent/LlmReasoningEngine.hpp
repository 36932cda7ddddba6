#pragma once
#include <memory>
#include <string>
#include <vector>
#include "AppConfig.hpp"
#include "agent/ReasoningEngine.hpp"
#include "chat_client.hpp"

namespace code_query {

// IReasoningEngine over a chat model. Classification, selection and assessment
// go to the helper model; the final answer goes to the chat model with the
// conversation history replayed as prior turns.
class LlmReasoningEngine : public IReasoningEngine {
public:
    LlmReasoningEngine(std::shared_ptr<IChatClient> chat, AppConfig config);

    Classification classify(const ClassifyRequest& req) override;
    FileSelection select_files(const SelectionRequest& req) override;
    ConfidenceAssessment assess_confidence(const AssessmentRequest& req) override;
    std::string generate_answer(const AnswerRequest& req) override;

    // Exposed for tests.
    std::string build_classify_prompt(const ClassifyRequest& req) const;
    std::string build_selection_prompt(const SelectionRequest& req) const;
    std::string build_assessment_prompt(const AssessmentRequest& req) const;
    std::string build_answer_prompt(const AnswerRequest& req) const;

private:
    std::shared_ptr<IChatClient> chat_;
    AppConfig config_;

    // Sends one prompt, records it in LogManager, rethrows failures.
    std::string call(const std::string& kind,
                     const std::string& prompt,
                     const std::string& model,
                     int ctx_window,
                     const std::vector<HistoryEntry>& history);
};

} // namespace code_query
