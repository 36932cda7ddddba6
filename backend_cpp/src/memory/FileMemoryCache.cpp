#include "memory/FileMemoryCache.hpp"
#include "text_util.hpp"
#include <spdlog/spdlog.h>

namespace code_query {

FileMemoryCache::FileMemoryCache(std::shared_ptr<IFileReader> reader, TruncationPolicy policy)
    : reader_(std::move(reader)), policy_(policy) {}

std::string FileMemoryCache::elision_marker(size_t elided_chars) {
    return "\n\n... (truncated " + std::to_string(elided_chars) + " chars) ...\n\n";
}

CacheEntry FileMemoryCache::make_entry(const std::string& path, const std::string& raw,
                                       const TruncationPolicy& policy) {
    CacheEntry entry{path, raw, false};
    if (raw.size() <= policy.ceiling) return entry;

    std::string head = utf8_safe_substr(raw, policy.head);
    std::string tail = utf8_safe_suffix(raw, policy.tail);
    size_t elided = raw.size() - head.size() - tail.size();

    entry.content = head + elision_marker(elided) + tail;
    entry.truncated = true;
    return entry;
}

const CacheEntry& FileMemoryCache::get(const std::string& path) {
    auto it = entries_.find(path);
    if (it != entries_.end()) {
        spdlog::debug("  - {} (cached)", path);
        return it->second;
    }

    std::string raw = reader_->read_full(path);
    CacheEntry entry = make_entry(path, raw, policy_);
    spdlog::debug("  - {} (loaded{})", path, entry.truncated ? ", truncated" : "");

    order_.push_back(path);
    return entries_.emplace(path, std::move(entry)).first->second;
}

const CacheEntry* FileMemoryCache::find(const std::string& path) const {
    auto it = entries_.find(path);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> FileMemoryCache::snapshot() const {
    return order_;
}

void FileMemoryCache::wipe() {
    spdlog::warn("🧹 File memory wiped by user ({} entries dropped).", entries_.size());
    entries_.clear();
    order_.clear();
}

} // namespace code_query
