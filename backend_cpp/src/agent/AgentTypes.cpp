#include "agent/AgentTypes.hpp"

namespace code_query {

const char* to_string(QueryAction action) {
    switch (action) {
        case QueryAction::SearchCode: return "SEARCH_CODE";
        case QueryAction::UseMemory: return "USE_MEMORY";
        case QueryAction::Direct: return "DIRECT";
    }
    return "SEARCH_CODE";
}

const char* to_string(ConfidenceLevel level) {
    switch (level) {
        case ConfidenceLevel::High: return "HIGH";
        case ConfidenceLevel::Medium: return "MEDIUM";
        case ConfidenceLevel::Low: return "LOW";
    }
    return "LOW";
}

const char* to_string(SearchPhase phase) {
    switch (phase) {
        case SearchPhase::Classifying: return "CLASSIFYING";
        case SearchPhase::Selecting: return "SELECTING";
        case SearchPhase::Loading: return "LOADING";
        case SearchPhase::Assessing: return "ASSESSING";
        case SearchPhase::Done: return "DONE";
    }
    return "DONE";
}

} // namespace code_query
