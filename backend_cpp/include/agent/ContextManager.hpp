#pragma once
#include <string>
#include <vector>
#include "agent/AgentTypes.hpp"
#include "file_index.hpp"
#include "text_util.hpp"

namespace code_query {

// Turns index, cache and history state into the text blocks the prompts embed.
class ContextManager {
public:
    static constexpr size_t kPreviewLineChars = 120;

    explicit ContextManager(size_t overview_limit = 200) : overview_limit_(overview_limit) {}

    std::vector<IndexViewEntry> build_index_view(const FileIndex& index) const {
        std::vector<IndexViewEntry> view;
        for (const auto& rec : index.records()) {
            if (view.size() >= overview_limit_) break;
            view.push_back({rec.path, rec.line_count, rec.extension, rec.preview});
        }
        return view;
    }

    static std::string render_index_overview(const std::vector<IndexViewEntry>& view, size_t total_files) {
        std::string out;
        for (size_t i = 0; i < view.size(); ++i) {
            out += std::to_string(i + 1) + ". " + view[i].path + " (" + std::to_string(view[i].line_count) +
                   " lines, " + (view[i].extension.empty() ? "no extension" : view[i].extension) + ")\n";
            std::string preview = one_line_preview(view[i].preview);
            if (!preview.empty()) out += "   " + preview + "\n";
        }
        if (total_files > view.size()) {
            out += "... and " + std::to_string(total_files - view.size()) + " more files\n";
        }
        return out;
    }

    // Whitespace runs collapsed to one space, capped at kPreviewLineChars.
    static std::string one_line_preview(const std::string& preview) {
        std::string flat;
        bool gap = false;
        for (char c : preview) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                gap = !flat.empty();
                continue;
            }
            if (gap) flat += ' ';
            gap = false;
            flat += c;
        }
        if (flat.size() <= kPreviewLineChars) return flat;
        return utf8_safe_substr(flat, kPreviewLineChars) + "...";
    }

    static std::string render_path_list(const std::vector<std::string>& paths) {
        std::string out;
        for (const auto& p : paths) out += "- " + p + "\n";
        return out;
    }

    // The one place file contents are concatenated for the answer prompt.
    static std::string build_evidence_bundle(const std::vector<AnalyzedFile>& files) {
        std::string payload;
        for (const auto& f : files) {
            if (!payload.empty()) payload += "\n\n";
            payload += "File: " + f.path + "\n```\n" + f.content + "\n```";
        }
        return payload;
    }

private:
    size_t overview_limit_;
};

} // namespace code_query
