#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include "AppConfig.hpp"

namespace code_query {

// Segment-wise containment: "src/net/a.cpp" is inside "src" but not inside "sr".
bool is_inside_path(const std::filesystem::path& child, const std::filesystem::path& parent);

// Ignore vs exception rules of the project filter, for a path relative to the root.
bool is_ignored_dir(const std::filesystem::path& rel_dir, const ProjectFilter& filter);
bool is_eligible_file(const std::filesystem::path& rel_file, const ProjectFilter& filter);

// Collaborator that turns codebase-relative paths into text.
// Every operation throws FileReadError on missing or unreadable paths.
class IFileReader {
public:
    virtual ~IFileReader() = default;

    virtual std::string read_prefix(const std::string& path, size_t max_bytes) = 0;
    virtual std::string read_full(const std::string& path) = 0;
    virtual std::uintmax_t file_size(const std::string& path) = 0;
};

class DiskFileReader : public IFileReader {
public:
    explicit DiskFileReader(std::filesystem::path root);

    std::string read_prefix(const std::string& path, size_t max_bytes) override;
    std::string read_full(const std::string& path) override;
    std::uintmax_t file_size(const std::string& path) override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;

    // Rejects paths that escape the root or do not name a regular file.
    std::filesystem::path resolve(const std::string& path) const;
};

} // namespace code_query
