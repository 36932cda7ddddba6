#include "memory/ConversationHistory.hpp"
#include "text_util.hpp"

namespace code_query {

void ConversationHistory::append(const std::string& query, const std::string& answer) {
    entries_.push_back({utf8_safe_substr(query, char_cap_), utf8_safe_substr(answer, char_cap_), next_index_++});
    while (entries_.size() > max_entries_) {
        entries_.pop_front();
    }
}

} // namespace code_query
