#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "AppConfig.hpp"
#include "agent/AgentExecutor.hpp"
#include "agent/ReasoningEngine.hpp"
#include "file_index.hpp"
#include "memory/ConversationHistory.hpp"
#include "memory/FileMemoryCache.hpp"
#include "tools/FileSystemTools.hpp"

namespace code_query {

// Everything one user's conversation with one codebase needs. All public
// operations take the session mutex, so at most one query or command touches
// the cache and history at a time.
class CodeSession {
public:
    CodeSession(const AppConfig& config,
                std::shared_ptr<IFileReader> reader,
                FileIndex index,
                std::shared_ptr<IReasoningEngine> engine);

    // Builds the index from disk; throws IndexBuildError.
    static std::unique_ptr<CodeSession> open(const std::string& codebase_dir,
                                             const AppConfig& config,
                                             std::shared_ptr<IReasoningEngine> engine);

    // Completed answers are appended to history; failed ones are not.
    SearchOutcome ask(const std::string& query, ProgressObserver observer = nullptr);

    std::vector<std::string> list_cached() const;
    size_t wipe_cache();
    void clear_history();
    std::vector<HistoryEntry> history() const;

    // Read-only views for the browsing commands.
    const FileIndex& index() const { return index_; }
    IFileReader& reader() { return *reader_; }

    void set_max_iterations(int n) { max_iterations_ = n < 1 ? 1 : n; }

private:
    std::shared_ptr<IFileReader> reader_;
    FileIndex index_;
    FileMemoryCache cache_;
    ConversationHistory history_;
    AgentExecutor executor_;
    int max_iterations_;
    mutable std::mutex mtx_;
};

} // namespace code_query
