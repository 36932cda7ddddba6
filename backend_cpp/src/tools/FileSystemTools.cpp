#include "tools/FileSystemTools.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace code_query {

namespace fs = std::filesystem;

bool is_inside_path(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;
    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();
    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        // Trailing slash leaves an empty segment behind.
        if (it_p->empty() || *it_p == ".") continue;
        if (it_c == c.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

bool is_ignored_dir(const fs::path& rel_dir, const ProjectFilter& filter) {
    if (rel_dir.filename() == ".git") return true;

    bool ignored = false;
    for (const auto& p : filter.ignored_paths) {
        if (is_inside_path(rel_dir, p)) { ignored = true; break; }
    }
    if (!ignored) return false;

    // Keep walking when an exception lives in (or below) this directory.
    for (const auto& p : filter.included_paths) {
        if (is_inside_path(rel_dir, p) || is_inside_path(p, rel_dir)) return false;
    }
    return true;
}

bool is_eligible_file(const fs::path& rel_file, const ProjectFilter& filter) {
    bool is_exception = false;
    for (const auto& p : filter.included_paths) {
        if (is_inside_path(rel_file, p)) { is_exception = true; break; }
    }
    if (is_exception) return true;

    for (const auto& p : filter.ignored_paths) {
        if (is_inside_path(rel_file, p)) return false;
    }

    if (filter.allowed_extensions.empty()) return true;
    std::string ext = to_lower(rel_file.extension().string());
    if (!ext.empty()) ext = ext.substr(1);
    for (const auto& a : filter.allowed_extensions) {
        if (ext == a) return true;
    }
    return false;
}

DiskFileReader::DiskFileReader(fs::path root)
    : root_(fs::absolute(root).lexically_normal()) {}

fs::path DiskFileReader::resolve(const std::string& path) const {
    fs::path rel = fs::path(path).lexically_normal();
    if (path.empty() || rel.is_absolute() || (!rel.empty() && *rel.begin() == "..")) {
        throw FileReadError(path, "path escapes the codebase root");
    }

    fs::path target = root_ / rel;
    std::error_code ec;
    if (!fs::exists(target, ec)) throw FileReadError(path, "file not found");
    if (!fs::is_regular_file(target, ec)) throw FileReadError(path, "not a regular file");
    return target;
}

std::string DiskFileReader::read_prefix(const std::string& path, size_t max_bytes) {
    fs::path target = resolve(path);
    std::ifstream f(target, std::ios::in | std::ios::binary);
    if (!f.is_open()) throw FileReadError(path, "permission denied");

    std::string buffer(max_bytes, '\0');
    f.read(buffer.data(), static_cast<std::streamsize>(max_bytes));
    if (f.bad()) throw FileReadError(path, "I/O error");
    buffer.resize(static_cast<size_t>(f.gcount()));
    return buffer;
}

std::string DiskFileReader::read_full(const std::string& path) {
    fs::path target = resolve(path);
    spdlog::debug("🔍 [I/O Probe] Reading: {}", target.string());

    std::ifstream f(target, std::ios::in | std::ios::binary);
    if (!f.is_open()) throw FileReadError(path, "permission denied");

    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) throw FileReadError(path, "I/O error");
    return buffer.str();
}

std::uintmax_t DiskFileReader::file_size(const std::string& path) {
    fs::path target = resolve(path);
    std::error_code ec;
    auto size = fs::file_size(target, ec);
    if (ec) throw FileReadError(path, ec.message());
    return size;
}

} // namespace code_query
