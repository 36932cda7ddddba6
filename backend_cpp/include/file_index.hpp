#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "AppConfig.hpp"
#include "tools/FileSystemTools.hpp"

namespace code_query {

struct FileRecord {
    std::string path;      // relative to the codebase root, '/'-separated
    size_t line_count = 0;
    std::string extension; // ".py", or empty
    std::string preview;
};

// Flat, read-only catalogue of the files of one codebase snapshot.
class FileIndex {
public:
    FileIndex() = default;

    // Walks `root` with the project filter. Throws IndexBuildError when the root
    // is missing or nothing is eligible. Only a bounded prefix of each file is read.
    static FileIndex build(const std::string& root,
                           IFileReader& reader,
                           const ProjectFilter& filter,
                           size_t preview_chars = 500);

    // For callers that already have the records (tests, remote snapshots).
    explicit FileIndex(std::vector<FileRecord> records);

    const FileRecord* lookup(const std::string& path) const;
    bool contains(const std::string& path) const { return lookup(path) != nullptr; }

    std::vector<FileRecord> list_directory(const std::string& prefix) const;

    const std::vector<FileRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    // Box-drawn directory tree of every indexed path.
    std::string render_tree(const std::string& root_name = ".") const;

private:
    std::vector<FileRecord> records_; // sorted by path
    std::unordered_map<std::string, size_t> by_path_;
};

} // namespace code_query
