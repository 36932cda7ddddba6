#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_query {

// Which files of the codebase are eligible for the index.
struct ProjectFilter {
    std::vector<std::string> allowed_extensions; // dot-free, lowercase; empty = all
    std::vector<std::string> ignored_paths;
    std::vector<std::string> included_paths;     // exceptions inside ignored paths
};

struct AppConfig {
    std::string bot_name = "Code Query Assistant";

    // Reasoning engine (Ollama chat API)
    std::string ollama_url = "http://localhost:11434";
    std::string chat_model = "llama3.1";
    std::string helper_model = "mistral";
    int chat_ctx_window = 16000;
    int helper_ctx_window = 4096;
    int request_timeout_seconds = 180;

    // Search loop
    int max_iterations = 3;
    size_t index_overview_limit = 200;

    // Conversation history
    size_t history_length = 4;
    size_t history_char_cap = 500;

    // File memory cache
    size_t cache_ceiling_chars = 8000;
    size_t cache_head_chars = 6000;
    size_t cache_tail_chars = 2000;

    // File index
    size_t preview_chars = 500;
    ProjectFilter filter{{}, {"node_modules", "build", "__pycache__"}, {}};

    // Throws ConfigError on out-of-range or inconsistent values.
    void validate() const;

    static AppConfig from_json(const nlohmann::json& j);

    // Explicit path must exist. Without one, config.json and .code_query/config.json
    // are searched upwards from the working directory; nothing found = defaults.
    static AppConfig load(const std::string& explicit_path = "");
};

} // namespace code_query
