#pragma once
#include <deque>
#include <string>
#include <vector>

namespace code_query {

struct HistoryEntry {
    std::string query;
    std::string answer;
    size_t index; // order of arrival, monotonically increasing
};

// Bounded FIFO of the most recent exchanges, fed back to the reasoning engine.
class ConversationHistory {
public:
    explicit ConversationHistory(size_t max_entries = 4, size_t char_cap = 500)
        : max_entries_(max_entries), char_cap_(char_cap) {}

    void append(const std::string& query, const std::string& answer);

    // Oldest first.
    std::vector<HistoryEntry> render() const { return {entries_.begin(), entries_.end()}; }

    void clear() { entries_.clear(); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    size_t capacity() const { return max_entries_; }

private:
    size_t max_entries_;
    size_t char_cap_;
    size_t next_index_ = 0;
    std::deque<HistoryEntry> entries_;
};

} // namespace code_query
