#include "chat_client.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace code_query {

using json = nlohmann::json;

OllamaChatClient::OllamaChatClient(std::string base_url, std::chrono::seconds timeout)
    : base_url_(std::move(base_url)), timeout_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string OllamaChatClient::chat(const std::vector<ChatMessage>& messages,
                                   const std::string& model,
                                   int ctx_window) {
    json j_messages = json::array();
    for (const auto& m : messages) {
        j_messages.push_back({{"role", m.role}, {"content", m.content}});
    }

    json payload = {
        {"model", model},
        {"messages", j_messages},
        {"stream", false},
        {"options", {{"num_ctx", ctx_window}}}
    };

    auto r = cpr::Post(cpr::Url{base_url_ + "/api/chat"},
                       cpr::Body{payload.dump(-1, ' ', false, json::error_handler_t::replace)},
                       cpr::Header{{"Content-Type", "application/json"}},
                       cpr::Timeout{std::chrono::duration_cast<std::chrono::milliseconds>(timeout_)});

    if (r.error) {
        if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            spdlog::error("❌ Chat request timed out after {}s ({})", timeout_.count(), model);
            throw ReasoningUnavailable("request to " + model + " timed out");
        }
        spdlog::error("❌ Cannot reach Ollama at {}: {}", base_url_, r.error.message);
        throw ReasoningUnavailable("cannot connect to reasoning engine: " + r.error.message);
    }

    if (r.status_code != 200) {
        spdlog::error("❌ Chat API Error [{}]: {}", r.status_code, utf8_safe_substr(r.text, 300));
        throw ReasoningUnavailable("reasoning engine returned HTTP " + std::to_string(r.status_code));
    }

    try {
        auto response_json = json::parse(r.text);
        return trim(response_json.at("message").at("content").get<std::string>());
    } catch (const json::exception& e) {
        throw ReasoningUnavailable(std::string("malformed chat response: ") + e.what());
    }
}

} // namespace code_query
