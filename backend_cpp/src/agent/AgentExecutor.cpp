#include "agent/AgentExecutor.hpp"
#include "agent/ResponseParser.hpp"
#include "errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace code_query {

AgentExecutor::AgentExecutor(std::shared_ptr<IReasoningEngine> engine, size_t overview_limit)
    : engine_(std::move(engine)), context_mgr_(overview_limit) {}

void AgentExecutor::notify(SearchPhase phase, const std::string& detail) {
    spdlog::debug("[{}] {}", to_string(phase), detail);
    if (observer_) observer_(phase, detail);
}

std::vector<std::string> AgentExecutor::validate_selection(const std::vector<std::string>& proposed,
                                                           const FileIndex& index,
                                                           const std::unordered_set<std::string>& analyzed) {
    std::vector<std::string> accepted;
    for (const auto& path : proposed) {
        if (!index.contains(path)) {
            spdlog::debug("Discarding unknown path from selection: {}", path);
            continue;
        }
        if (analyzed.count(path)) continue;
        if (std::find(accepted.begin(), accepted.end(), path) != accepted.end()) continue;
        accepted.push_back(path);
        if (accepted.size() == kMaxFilesPerSelection) break;
    }
    return accepted;
}

std::vector<AnalyzedFile> AgentExecutor::collect(const FileMemoryCache& cache, const std::vector<std::string>& paths) {
    std::vector<AnalyzedFile> files;
    files.reserve(paths.size());
    for (const auto& p : paths) {
        if (const CacheEntry* entry = cache.find(p)) files.push_back({p, entry->content});
    }
    return files;
}

SearchOutcome AgentExecutor::run(const std::string& query,
                                 const FileIndex& index,
                                 FileMemoryCache& cache,
                                 const ConversationHistory& history,
                                 int max_iterations) {
    SearchOutcome outcome;
    if (max_iterations < 1) max_iterations = 1;
    const std::vector<HistoryEntry> past = history.render();

    try {
        notify(SearchPhase::Classifying, query);
        Classification decision = engine_->classify({query, cache.snapshot(), past});
        outcome.action = decision.action;
        spdlog::info("Mode: {}{}", to_string(decision.action),
                     decision.reason.empty() ? "" : " (" + decision.reason + ")");

        if (decision.action == QueryAction::Direct) {
            outcome.answer = engine_->generate_answer({query, "", past, AnswerMode::Direct});
            notify(SearchPhase::Done, "direct answer");
            return outcome;
        }

        std::optional<std::string> carried_term;
        if (decision.action == QueryAction::UseMemory) {
            if (answer_from_memory(query, cache, past, outcome, carried_term)) {
                notify(SearchPhase::Done, "answered from memory");
                return outcome;
            }
            outcome.action = QueryAction::SearchCode;
        }

        search_loop(query, index, cache, past, max_iterations, carried_term, outcome);

        auto files = collect(cache, outcome.analyzed_files);
        outcome.answer = engine_->generate_answer(
            {query, ContextManager::build_evidence_bundle(files), past, AnswerMode::Evidence});
    } catch (const ReasoningUnavailable& e) {
        spdlog::error("❌ Query aborted: {}", e.what());
        outcome.status = OutcomeStatus::Failed;
        outcome.error = e.what();
        outcome.answer = std::string("Could not complete analysis: ") + e.what();
    }

    notify(SearchPhase::Done, std::to_string(outcome.analyzed_files.size()) + " files analyzed");
    return outcome;
}

bool AgentExecutor::answer_from_memory(const std::string& query,
                                       FileMemoryCache& cache,
                                       const std::vector<HistoryEntry>& history,
                                       SearchOutcome& outcome,
                                       std::optional<std::string>& carried_term) {
    if (cache.empty()) {
        spdlog::info("No files in memory. Switching to codebase search...");
        return false;
    }

    std::vector<std::string> cached = cache.snapshot();
    auto files = collect(cache, cached);

    notify(SearchPhase::Assessing, "checking " + std::to_string(files.size()) + " cached files");
    ConfidenceAssessment assessment = engine_->assess_confidence({query, files, history});
    if (assessment.level == ConfidenceLevel::Low) {
        spdlog::info("Cached files are not enough ({}), searching the codebase", assessment.reason);
        carried_term = assessment.suggested_term;
        return false;
    }

    outcome.analyzed_files = cached;
    outcome.answer = engine_->generate_answer(
        {query, ContextManager::build_evidence_bundle(files), history, AnswerMode::Memory});
    return true;
}

void AgentExecutor::search_loop(const std::string& query,
                                const FileIndex& index,
                                FileMemoryCache& cache,
                                const std::vector<HistoryEntry>& history,
                                int max_iterations,
                                std::optional<std::string> suggested_term,
                                SearchOutcome& outcome) {
    const std::vector<IndexViewEntry> view = context_mgr_.build_index_view(index);
    std::vector<std::string> index_paths;
    index_paths.reserve(index.size());
    for (const auto& rec : index.records()) index_paths.push_back(rec.path);
    std::unordered_set<std::string> analyzed;

    for (int iteration = 1; iteration <= max_iterations; ++iteration) {
        if (iteration > 1) {
            spdlog::info("Refining search (iteration {}){}", iteration,
                         suggested_term ? ": " + *suggested_term : "");
        }

        // SELECTING
        notify(SearchPhase::Selecting, "iteration " + std::to_string(iteration));
        std::vector<std::string> cached_elsewhere;
        for (const auto& p : cache.snapshot()) {
            if (!analyzed.count(p)) cached_elsewhere.push_back(p);
        }
        SelectionRequest request{query, view, index.size(), outcome.analyzed_files, cached_elsewhere, suggested_term,
                                 index_paths};
        FileSelection selection = engine_->select_files(request);

        IterationRecord record;
        record.iteration = iteration;
        record.files_requested = validate_selection(selection.paths, index, analyzed);

        if (record.files_requested.empty() && iteration > 1) {
            spdlog::info("Sufficient context gathered");
            break;
        }

        // LOADING
        notify(SearchPhase::Loading, std::to_string(record.files_requested.size()) + " files");
        for (const auto& path : record.files_requested) {
            try {
                bool was_cached = cache.contains(path);
                cache.get(path);
                spdlog::info("  - {} ({})", path, was_cached ? "cached" : "loaded");
                analyzed.insert(path);
                outcome.analyzed_files.push_back(path);
                record.files_newly_loaded.push_back(path);
            } catch (const FileReadError& e) {
                spdlog::warn("  - {} (skipped: {})", path, e.what());
                record.files_failed.push_back(path);
            }
        }
        outcome.iterations.push_back(record);

        // ASSESSING
        notify(SearchPhase::Assessing, std::to_string(outcome.analyzed_files.size()) + " files analyzed");
        ConfidenceAssessment assessment = engine_->assess_confidence(
            {query, collect(cache, outcome.analyzed_files), history});
        outcome.iterations.back().confidence = assessment.level;
        outcome.iterations.back().suggested_term = assessment.suggested_term;
        spdlog::info("Confidence: {}", to_string(assessment.level));

        if (assessment.level == ConfidenceLevel::High) break;
        if (record.files_newly_loaded.empty()) break;
        if (iteration == max_iterations) break;

        suggested_term = assessment.suggested_term;
    }
}

} // namespace code_query
