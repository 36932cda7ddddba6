#include "agent/ResponseParser.hpp"
#include "text_util.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace code_query {
namespace response_parser {

using json = nlohmann::json;

namespace {

// Brace matching that ignores braces inside JSON strings.
std::string first_balanced_object(const std::string& text, size_t from = 0) {
    size_t start = text.find('{', from);
    while (start != std::string::npos) {
        int depth = 0;
        bool in_string = false;
        bool escaped = false;
        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];
            if (in_string) {
                if (escaped) escaped = false;
                else if (c == '\\') escaped = true;
                else if (c == '"') in_string = false;
                continue;
            }
            if (c == '"') in_string = true;
            else if (c == '{') depth++;
            else if (c == '}' && --depth == 0) return text.substr(start, i - start + 1);
        }
        start = text.find('{', start + 1);
    }
    return "";
}

std::optional<json> try_parse_object(const std::string& candidate) {
    if (candidate.empty()) return std::nullopt;
    json j = json::parse(candidate, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

bool contains_word(const std::string& upper_text, const std::string& word) {
    size_t pos = upper_text.find(word);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !(std::isalnum(static_cast<unsigned char>(upper_text[pos - 1])) || upper_text[pos - 1] == '_');
        size_t end = pos + word.size();
        bool right_ok = end >= upper_text.size() || !(std::isalnum(static_cast<unsigned char>(upper_text[end])) || upper_text[end] == '_');
        if (left_ok && right_ok) return true;
        pos = upper_text.find(word, pos + 1);
    }
    return false;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::optional<std::string> clean_suggestion(const json& value) {
    if (!value.is_string()) return std::nullopt;
    std::string s = trim(value.get<std::string>());
    std::string lowered = to_lower(s);
    if (s.empty() || lowered == "null" || lowered == "none" || lowered == "n/a") return std::nullopt;
    return s;
}

// Missing or non-string values read as empty.
std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace

std::optional<json> extract_json(const std::string& raw) {
    size_t fence = raw.find("```");
    if (fence != std::string::npos) {
        if (auto j = try_parse_object(first_balanced_object(raw, fence + 3))) return j;
    }

    size_t from = 0;
    while (from < raw.size()) {
        std::string candidate = first_balanced_object(raw, from);
        if (candidate.empty()) break;
        if (auto j = try_parse_object(candidate)) return j;
        from = raw.find(candidate, from) + 1;
    }
    return std::nullopt;
}

std::optional<QueryAction> action_from_string(const std::string& s) {
    std::string u = to_upper(trim(s));
    if (u == "SEARCH_CODE") return QueryAction::SearchCode;
    if (u == "USE_MEMORY") return QueryAction::UseMemory;
    if (u == "DIRECT") return QueryAction::Direct;
    return std::nullopt;
}

std::optional<ConfidenceLevel> confidence_from_string(const std::string& s) {
    std::string u = to_upper(trim(s));
    if (u == "HIGH") return ConfidenceLevel::High;
    if (u == "MEDIUM") return ConfidenceLevel::Medium;
    if (u == "LOW") return ConfidenceLevel::Low;
    return std::nullopt;
}

Classification parse_classification(const std::string& raw) {
    Classification result;
    if (auto j = extract_json(raw)) {
        result.reason = string_field(*j, "reason");
        if (j->contains("action") && (*j)["action"].is_string()) {
            if (auto action = action_from_string((*j)["action"].get<std::string>())) {
                result.action = *action;
                return result;
            }
        }
    }

    std::string upper = to_upper(raw);
    if (upper.find("SEARCH_CODE") != std::string::npos) {
        result.action = QueryAction::SearchCode;
    } else if (upper.find("USE_MEMORY") != std::string::npos) {
        result.action = QueryAction::UseMemory;
    } else if (contains_word(upper, "DIRECT")) {
        result.action = QueryAction::Direct;
    } else {
        spdlog::warn("⚠️  Unparseable classification, defaulting to SEARCH_CODE");
        result.action = QueryAction::SearchCode;
        result.reason = "classification uncertain";
    }
    return result;
}

FileSelection parse_selection(const std::string& raw, const std::vector<std::string>& candidate_paths) {
    FileSelection result;
    std::vector<std::string> picked;
    bool have_list = false;

    if (auto j = extract_json(raw)) {
        if (j->contains("sufficient") && (*j)["sufficient"].is_boolean()) {
            result.sufficient = (*j)["sufficient"].get<bool>();
        }
        result.reasoning = string_field(*j, "reasoning");
        if (j->contains("files") && (*j)["files"].is_array()) {
            have_list = true;
            for (const auto& f : (*j)["files"]) {
                if (f.is_string()) picked.push_back(trim(f.get<std::string>()));
            }
        }
    }

    if (!have_list) {
        spdlog::warn("⚠️  File selection was not valid JSON, scanning text for known paths");
        for (const auto& path : candidate_paths) {
            if (raw.find(path) != std::string::npos) picked.push_back(path);
        }
    }

    for (auto& p : picked) {
        if (p.empty()) continue;
        if (std::find(result.paths.begin(), result.paths.end(), p) != result.paths.end()) continue;
        result.paths.push_back(std::move(p));
        if (result.paths.size() == kMaxFilesPerSelection) break;
    }
    return result;
}

ConfidenceAssessment parse_assessment(const std::string& raw) {
    ConfidenceAssessment result;
    bool resolved = false;
    bool had_json = false;

    if (auto j = extract_json(raw)) {
        had_json = true;
        result.reason = string_field(*j, "reason");
        if (j->contains("confidence") && (*j)["confidence"].is_string()) {
            if (auto level = confidence_from_string((*j)["confidence"].get<std::string>())) {
                result.level = *level;
                resolved = true;
            }
        }
        for (const char* key : {"suggestion", "follow_up_query", "suggested_term"}) {
            if (j->contains(key)) {
                result.suggested_term = clean_suggestion((*j)[key]);
                if (result.suggested_term) break;
            }
        }
    }

    if (!resolved && had_json) {
        spdlog::warn("⚠️  Confidence missing or out of range, defaulting to LOW");
        result.level = ConfidenceLevel::Low;
    } else if (!resolved) {
        std::string upper = to_upper(raw);
        bool high = contains_word(upper, "HIGH");
        bool medium = contains_word(upper, "MEDIUM");
        bool low = contains_word(upper, "LOW");
        if (high + medium + low == 1) {
            result.level = high ? ConfidenceLevel::High : medium ? ConfidenceLevel::Medium : ConfidenceLevel::Low;
        } else {
            spdlog::warn("⚠️  Unparseable confidence assessment, defaulting to LOW");
            result.level = ConfidenceLevel::Low;
            if (result.reason.empty()) result.reason = "assessment unparseable";
        }
    }

    if (result.level == ConfidenceLevel::High) result.suggested_term.reset();
    return result;
}

} // namespace response_parser
} // namespace code_query
