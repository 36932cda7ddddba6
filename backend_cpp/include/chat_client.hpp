#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace code_query {

struct ChatMessage {
    std::string role; // "user" | "assistant" | "system"
    std::string content;
};

// Blocking chat completion. Throws ReasoningUnavailable on transport failure,
// timeout or a response without a message.
class IChatClient {
public:
    virtual ~IChatClient() = default;
    virtual std::string chat(const std::vector<ChatMessage>& messages,
                             const std::string& model,
                             int ctx_window) = 0;
};

class OllamaChatClient : public IChatClient {
public:
    OllamaChatClient(std::string base_url, std::chrono::seconds timeout);

    std::string chat(const std::vector<ChatMessage>& messages,
                     const std::string& model,
                     int ctx_window) override;

private:
    std::string base_url_;
    std::chrono::seconds timeout_;
};

} // namespace code_query
