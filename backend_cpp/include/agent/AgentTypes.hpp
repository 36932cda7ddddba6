#pragma once
#include <optional>
#include <string>
#include <vector>
#include "memory/ConversationHistory.hpp"

namespace code_query {

enum class QueryAction { SearchCode, UseMemory, Direct };

enum class ConfidenceLevel { High, Medium, Low };

enum class SearchPhase { Classifying, Selecting, Loading, Assessing, Done };

const char* to_string(QueryAction action);
const char* to_string(ConfidenceLevel level);
const char* to_string(SearchPhase phase);

// --- Reasoning engine calls: one request/response pair per call kind ---

struct ClassifyRequest {
    std::string query;
    std::vector<std::string> cached_paths;
    std::vector<HistoryEntry> history;
};

struct Classification {
    QueryAction action = QueryAction::SearchCode;
    std::string reason;
};

// Path + size summary shown to the engine during selection.
struct IndexViewEntry {
    std::string path;
    size_t line_count;
    std::string extension;
    std::string preview;
};

struct SelectionRequest {
    std::string query;
    std::vector<IndexViewEntry> index_view;
    size_t total_files = 0;                     // index size, may exceed index_view
    std::vector<std::string> already_analyzed;
    std::vector<std::string> cached_elsewhere;  // in cache but not yet analyzed for this query
    std::optional<std::string> suggested_term;
    std::vector<std::string> index_paths;       // every indexed path, for matching free-text replies
};

struct FileSelection {
    std::vector<std::string> paths;
    bool sufficient = false;
    std::string reasoning;
};

struct AnalyzedFile {
    std::string path;
    std::string content;
};

struct AssessmentRequest {
    std::string query;
    std::vector<AnalyzedFile> files;
    std::vector<HistoryEntry> history;
};

struct ConfidenceAssessment {
    ConfidenceLevel level = ConfidenceLevel::Low;
    std::optional<std::string> suggested_term;
    std::string reason;
};

enum class AnswerMode { Evidence, Memory, Direct };

struct AnswerRequest {
    std::string query;
    std::string evidence_bundle;
    std::vector<HistoryEntry> history;
    AnswerMode mode = AnswerMode::Evidence;
};

// --- Controller bookkeeping ---

struct IterationRecord {
    int iteration = 0;
    std::vector<std::string> files_requested;
    std::vector<std::string> files_newly_loaded;
    std::vector<std::string> files_failed;
    ConfidenceLevel confidence = ConfidenceLevel::Low;
    std::optional<std::string> suggested_term;
};

enum class OutcomeStatus { Completed, Failed };

struct SearchOutcome {
    OutcomeStatus status = OutcomeStatus::Completed;
    std::string answer;
    std::string error;                       // set when status == Failed
    QueryAction action = QueryAction::SearchCode;
    std::vector<std::string> analyzed_files; // load order
    std::vector<IterationRecord> iterations;

    bool ok() const { return status == OutcomeStatus::Completed; }
};

} // namespace code_query
