#include "AppConfig.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_query {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::vector<std::string> normalize_extensions(std::vector<std::string> exts) {
    for (auto& ext : exts) {
        if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    exts.erase(std::remove(exts.begin(), exts.end(), std::string{}), exts.end());
    return exts;
}

std::vector<std::string> normalize_paths(const std::vector<std::string>& paths) {
    std::vector<std::string> clean;
    for (const auto& p : paths) {
        if (p.empty()) continue;
        std::string norm = fs::path(p).lexically_normal().generic_string();
        while (!norm.empty() && norm.back() == '/') norm.pop_back();
        if (!norm.empty()) clean.push_back(norm);
    }
    return clean;
}

fs::path find_config_file() {
    std::error_code ec;
    fs::path dir = fs::current_path(ec);
    if (ec) return {};
    while (true) {
        for (const auto& candidate : {dir / "config.json", dir / ".code_query" / "config.json"}) {
            if (fs::is_regular_file(candidate, ec)) return candidate;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    return {};
}

} // namespace

void AppConfig::validate() const {
    if (max_iterations < 1) throw ConfigError("max_iterations must be at least 1");
    if (history_length < 1) throw ConfigError("history_length must be at least 1");
    if (cache_head_chars + cache_tail_chars > cache_ceiling_chars) {
        throw ConfigError("cache_head_chars + cache_tail_chars must not exceed cache_ceiling_chars");
    }
    if (request_timeout_seconds <= 0) throw ConfigError("request_timeout_seconds must be positive");
    if (ollama_url.empty()) throw ConfigError("ollama_url must not be empty");
}

AppConfig AppConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("configuration root must be a JSON object");

    AppConfig cfg;
    try {
        cfg.bot_name = j.value("bot_name", cfg.bot_name);
        cfg.ollama_url = j.value("ollama_url", cfg.ollama_url);
        cfg.chat_model = j.value("chat_model", cfg.chat_model);
        cfg.helper_model = j.value("helper_model", cfg.helper_model);
        cfg.chat_ctx_window = j.value("chat_ctx_window", cfg.chat_ctx_window);
        cfg.helper_ctx_window = j.value("helper_ctx_window", cfg.helper_ctx_window);
        cfg.request_timeout_seconds = j.value("request_timeout_seconds", cfg.request_timeout_seconds);
        cfg.max_iterations = j.value("max_iterations", cfg.max_iterations);
        cfg.index_overview_limit = j.value("index_overview_limit", cfg.index_overview_limit);
        cfg.history_length = j.value("history_length", cfg.history_length);
        cfg.history_char_cap = j.value("history_char_cap", cfg.history_char_cap);
        cfg.cache_ceiling_chars = j.value("cache_ceiling_chars", cfg.cache_ceiling_chars);
        cfg.cache_head_chars = j.value("cache_head_chars", cfg.cache_head_chars);
        cfg.cache_tail_chars = j.value("cache_tail_chars", cfg.cache_tail_chars);
        cfg.preview_chars = j.value("preview_chars", cfg.preview_chars);

        cfg.filter.allowed_extensions = normalize_extensions(
            j.value("allowed_extensions", cfg.filter.allowed_extensions));
        cfg.filter.ignored_paths = normalize_paths(j.value("ignored_paths", cfg.filter.ignored_paths));
        cfg.filter.included_paths = normalize_paths(j.value("included_paths", cfg.filter.included_paths));
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

AppConfig AppConfig::load(const std::string& explicit_path) {
    fs::path path;
    if (!explicit_path.empty()) {
        path = explicit_path;
        if (!fs::exists(path)) throw ConfigError("config file not found: " + explicit_path);
    } else {
        path = find_config_file();
    }

    if (path.empty()) {
        spdlog::info("⚙️  No config.json found, using defaults.");
        return AppConfig{};
    }

    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open config file: " + path.string());

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw ConfigError("config file " + path.string() + " is not valid JSON: " + e.what());
    }

    AppConfig cfg = from_json(j);
    spdlog::info("⚙️  Config loaded from {}: chat={}, helper={}, {} ignores, {} exceptions.",
                 path.string(), cfg.chat_model, cfg.helper_model,
                 cfg.filter.ignored_paths.size(), cfg.filter.included_paths.size());
    return cfg;
}

} // namespace code_query
