#include "session.hpp"
#include <spdlog/spdlog.h>

namespace code_query {

CodeSession::CodeSession(const AppConfig& config,
                         std::shared_ptr<IFileReader> reader,
                         FileIndex index,
                         std::shared_ptr<IReasoningEngine> engine)
    : reader_(reader),
      index_(std::move(index)),
      cache_(reader, TruncationPolicy{config.cache_ceiling_chars, config.cache_head_chars, config.cache_tail_chars}),
      history_(config.history_length, config.history_char_cap),
      executor_(std::move(engine), config.index_overview_limit),
      max_iterations_(config.max_iterations) {}

std::unique_ptr<CodeSession> CodeSession::open(const std::string& codebase_dir,
                                               const AppConfig& config,
                                               std::shared_ptr<IReasoningEngine> engine) {
    auto reader = std::make_shared<DiskFileReader>(codebase_dir);
    FileIndex index = FileIndex::build(codebase_dir, *reader, config.filter, config.preview_chars);
    return std::make_unique<CodeSession>(config, reader, std::move(index), std::move(engine));
}

SearchOutcome CodeSession::ask(const std::string& query, ProgressObserver observer) {
    std::lock_guard<std::mutex> lock(mtx_);
    executor_.set_observer(std::move(observer));
    SearchOutcome outcome;
    try {
        outcome = executor_.run(query, index_, cache_, history_, max_iterations_);
    } catch (...) {
        executor_.set_observer(nullptr);
        throw;
    }
    executor_.set_observer(nullptr);

    if (outcome.ok()) history_.append(query, outcome.answer);
    return outcome;
}

std::vector<std::string> CodeSession::list_cached() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cache_.snapshot();
}

size_t CodeSession::wipe_cache() {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t dropped = cache_.size();
    cache_.wipe();
    return dropped;
}

void CodeSession::clear_history() {
    std::lock_guard<std::mutex> lock(mtx_);
    history_.clear();
    spdlog::info("Conversation history cleared.");
}

std::vector<HistoryEntry> CodeSession::history() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return history_.render();
}

} // namespace code_query
