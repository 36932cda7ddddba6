#pragma once
#include <string>
#include "agent/AgentTypes.hpp"

namespace code_query {

// The four calls the search controller makes. Implementations may throw
// ReasoningUnavailable from any of them; responses are already validated into
// typed values, but the controller still checks paths against the index.
class IReasoningEngine {
public:
    virtual ~IReasoningEngine() = default;

    virtual Classification classify(const ClassifyRequest& req) = 0;
    virtual FileSelection select_files(const SelectionRequest& req) = 0;
    virtual ConfidenceAssessment assess_confidence(const AssessmentRequest& req) = 0;
    virtual std::string generate_answer(const AnswerRequest& req) = 0;
};

} // namespace code_query
