#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "tools/FileSystemTools.hpp"

namespace code_query {

struct CacheEntry {
    std::string path;
    std::string content;
    bool truncated = false;
};

struct TruncationPolicy {
    size_t ceiling = 8000;
    size_t head = 6000;
    size_t tail = 2000;
};

// Session-scoped path -> content store. Entries are added on first successful
// load and only disappear through wipe(). Not thread-safe: the owning session
// serialises access.
class FileMemoryCache {
public:
    FileMemoryCache(std::shared_ptr<IFileReader> reader, TruncationPolicy policy = {});

    // Cache hit: no I/O. Miss: read, truncate, store. FileReadError propagates
    // and nothing is stored.
    const CacheEntry& get(const std::string& path);

    const CacheEntry* find(const std::string& path) const;
    bool contains(const std::string& path) const { return find(path) != nullptr; }

    // Paths in load order.
    std::vector<std::string> snapshot() const;

    // Irreversible; only ever triggered by an explicit user command.
    void wipe();

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const TruncationPolicy& policy() const { return policy_; }

    static std::string elision_marker(size_t elided_chars);
    static CacheEntry make_entry(const std::string& path, const std::string& raw, const TruncationPolicy& policy);

private:
    std::shared_ptr<IFileReader> reader_;
    TruncationPolicy policy_;
    std::unordered_map<std::string, CacheEntry> entries_;
    std::vector<std::string> order_;
};

} // namespace code_query
