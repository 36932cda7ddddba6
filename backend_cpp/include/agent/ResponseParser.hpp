#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "agent/AgentTypes.hpp"

namespace code_query {

constexpr size_t kMaxFilesPerSelection = 3;

// Engine output is free text that usually wraps a JSON object. These turn it
// into typed values and never throw: anything unusable maps to a conservative
// default.
namespace response_parser {

// ```json fenced block first, then the first balanced {...} in the text.
std::optional<nlohmann::json> extract_json(const std::string& raw);

// Unknown or missing action: keyword scan, then SEARCH_CODE.
Classification parse_classification(const std::string& raw);

// Without a usable "files" array, falls back to candidate paths quoted in the
// text. Duplicates removed, capped at kMaxFilesPerSelection.
FileSelection parse_selection(const std::string& raw, const std::vector<std::string>& candidate_paths);

// Unknown or missing confidence: keyword scan, then LOW. Suggestions are kept
// for MEDIUM/LOW only.
ConfidenceAssessment parse_assessment(const std::string& raw);

std::optional<QueryAction> action_from_string(const std::string& s);
std::optional<ConfidenceLevel> confidence_from_string(const std::string& s);

} // namespace response_parser

} // namespace code_query
