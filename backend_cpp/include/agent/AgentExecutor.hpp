#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "agent/AgentTypes.hpp"
#include "agent/ContextManager.hpp"
#include "agent/ReasoningEngine.hpp"
#include "file_index.hpp"
#include "memory/ConversationHistory.hpp"
#include "memory/FileMemoryCache.hpp"

namespace code_query {

using ProgressObserver = std::function<void(SearchPhase phase, const std::string& detail)>;

// Agentic search controller: classify, then select -> load -> assess until the
// engine is confident, nothing new turns up, or the iteration budget runs out;
// then one final answer call over every analyzed file.
class AgentExecutor {
public:
    explicit AgentExecutor(std::shared_ptr<IReasoningEngine> engine, size_t overview_limit = 200);

    void set_observer(ProgressObserver observer) { observer_ = std::move(observer); }

    // Never throws ReasoningUnavailable: a failed engine call ends the query
    // with status Failed and whatever files were analyzed up to that point.
    // The cache is updated in place.
    SearchOutcome run(const std::string& query,
                      const FileIndex& index,
                      FileMemoryCache& cache,
                      const ConversationHistory& history,
                      int max_iterations = 3);

private:
    std::shared_ptr<IReasoningEngine> engine_;
    ContextManager context_mgr_;
    ProgressObserver observer_;

    // True when the cached files were enough and outcome holds the answer.
    bool answer_from_memory(const std::string& query,
                            FileMemoryCache& cache,
                            const std::vector<HistoryEntry>& history,
                            SearchOutcome& outcome,
                            std::optional<std::string>& carried_term);

    void search_loop(const std::string& query,
                     const FileIndex& index,
                     FileMemoryCache& cache,
                     const std::vector<HistoryEntry>& history,
                     int max_iterations,
                     std::optional<std::string> suggested_term,
                     SearchOutcome& outcome);

    // Drops unknown, already analyzed and duplicate paths, then caps the count.
    static std::vector<std::string> validate_selection(const std::vector<std::string>& proposed,
                                                       const FileIndex& index,
                                                       const std::unordered_set<std::string>& analyzed);

    static std::vector<AnalyzedFile> collect(const FileMemoryCache& cache, const std::vector<std::string>& paths);

    void notify(SearchPhase phase, const std::string& detail);
};

} // namespace code_query
