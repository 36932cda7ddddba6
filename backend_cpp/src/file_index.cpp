#include "file_index.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <filesystem>
#include <functional>
#include <map>
#include <sstream>
#include <spdlog/spdlog.h>

namespace code_query {

namespace fs = std::filesystem;

namespace {

// Line counts come from this much of each file; longer files are extrapolated.
constexpr size_t kLineSampleBytes = 64 * 1024;

struct TreeNode {
    std::map<std::string, TreeNode> children;
};

void scan_directory_recursive(const fs::path& current_dir,
                              const fs::path& root_dir,
                              const ProjectFilter& filter,
                              std::vector<std::string>& results) {
    std::error_code ec;
    fs::directory_iterator it(current_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Scanner skipped {}: {}", current_dir.string(), ec.message());
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& entry = *it;
        fs::path rel = fs::relative(entry.path(), root_dir, ec);
        if (ec) continue;

        if (entry.is_directory(ec)) {
            if (is_ignored_dir(rel, filter)) {
                spdlog::debug("DIR  | {} | SKIP", rel.generic_string());
                continue;
            }
            scan_directory_recursive(entry.path(), root_dir, filter, results);
        } else if (entry.is_regular_file(ec)) {
            if (is_eligible_file(rel, filter)) {
                results.push_back(rel.generic_string());
            } else {
                spdlog::debug("FILE | {} | SKIP", rel.generic_string());
            }
        }
    }
}

size_t estimate_line_count(const std::string& sample, std::uintmax_t total_size) {
    if (sample.empty()) return 0;
    size_t newlines = static_cast<size_t>(std::count(sample.begin(), sample.end(), '\n'));
    size_t lines = newlines + (sample.back() == '\n' ? 0 : 1);
    if (total_size <= sample.size()) return lines;
    double ratio = static_cast<double>(total_size) / static_cast<double>(sample.size());
    return static_cast<size_t>(static_cast<double>(lines) * ratio);
}

} // namespace

FileIndex::FileIndex(std::vector<FileRecord> records) {
    std::sort(records.begin(), records.end(),
              [](const FileRecord& a, const FileRecord& b) { return a.path < b.path; });
    for (auto& rec : records) {
        if (by_path_.count(rec.path)) {
            spdlog::warn("Duplicate index path dropped: {}", rec.path);
            continue;
        }
        by_path_.emplace(rec.path, records_.size());
        records_.push_back(std::move(rec));
    }
}

FileIndex FileIndex::build(const std::string& root,
                           IFileReader& reader,
                           const ProjectFilter& filter,
                           size_t preview_chars) {
    std::error_code ec;
    fs::path root_dir = fs::absolute(root, ec).lexically_normal();
    if (ec || !fs::is_directory(root_dir, ec)) {
        throw IndexBuildError("codebase root does not exist or is not a directory: " + root);
    }

    spdlog::info("🔍 Scanning {} | Ignore: {} | Include: {}", root_dir.string(),
                 filter.ignored_paths.size(), filter.included_paths.size());

    std::vector<std::string> paths;
    scan_directory_recursive(root_dir, root_dir, filter, paths);

    std::vector<FileRecord> records;
    records.reserve(paths.size());
    for (const auto& path : paths) {
        try {
            std::uintmax_t size = reader.file_size(path);
            std::string sample = reader.read_prefix(path, std::max(preview_chars, kLineSampleBytes));

            FileRecord rec;
            rec.path = path;
            rec.extension = fs::path(path).extension().string();
            rec.line_count = estimate_line_count(sample, size);
            rec.preview = utf8_safe_substr(sample, preview_chars);
            records.push_back(std::move(rec));
        } catch (const FileReadError& e) {
            spdlog::warn("Failed to index {}: {}", path, e.what());
        }
    }

    if (records.empty()) {
        throw IndexBuildError("no eligible files found under " + root_dir.string());
    }

    FileIndex index(std::move(records));
    spdlog::info("📚 Indexed {} files", index.size());
    return index;
}

const FileRecord* FileIndex::lookup(const std::string& path) const {
    auto it = by_path_.find(path);
    if (it == by_path_.end()) return nullptr;
    return &records_[it->second];
}

std::vector<FileRecord> FileIndex::list_directory(const std::string& prefix) const {
    // Records are sorted, so matches form one contiguous run.
    auto first = std::lower_bound(records_.begin(), records_.end(), prefix,
                                  [](const FileRecord& r, const std::string& p) { return r.path < p; });
    std::vector<FileRecord> out;
    for (auto it = first; it != records_.end() && it->path.compare(0, prefix.size(), prefix) == 0; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::string FileIndex::render_tree(const std::string& root_name) const {
    TreeNode root;
    for (const auto& rec : records_) {
        std::stringstream ss(rec.path);
        std::string part;
        TreeNode* current = &root;
        while (std::getline(ss, part, '/')) {
            if (part.empty()) continue;
            current = &(current->children[part]);
        }
    }

    std::stringstream out;
    out << root_name << "/\n";

    std::function<void(const TreeNode&, const std::string&)> draw_node;
    draw_node = [&](const TreeNode& node, const std::string& prefix) {
        for (auto it = node.children.begin(); it != node.children.end(); ++it) {
            bool is_last = std::next(it) == node.children.end();
            out << prefix << (is_last ? "└── " : "├── ") << it->first
                << (it->second.children.empty() ? "" : "/") << "\n";
            if (!it->second.children.empty()) {
                draw_node(it->second, prefix + (is_last ? "    " : "│   "));
            }
        }
    };
    draw_node(root, "");
    return out.str();
}

} // namespace code_query
