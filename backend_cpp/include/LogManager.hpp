#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace code_query {

struct InteractionLog {
    long long timestamp;
    std::string call;           // classify | select_files | assess_confidence | generate_answer
    std::string model;
    std::string prompt_preview;
    std::string ai_response;
    int token_count_est;        // Rough estimate
    double duration_ms;
    bool ok;
};

class LogManager {
public:
    // Singleton access
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxLogs) { // Keep last 50 only
            logs_.pop_front();
        }
    }

    std::vector<InteractionLog> recent(size_t n) {
        std::lock_guard<std::mutex> lock(mtx_);
        size_t start = logs_.size() > n ? logs_.size() - n : 0;
        return {logs_.begin() + static_cast<std::ptrdiff_t>(start), logs_.end()};
    }

    json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        // Return in reverse order (newest first)
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"call", it->call},
                {"model", it->model},
                {"prompt_preview", it->prompt_preview},
                {"ai_response", it->ai_response},
                {"token_count_est", it->token_count_est},
                {"duration_ms", it->duration_ms},
                {"ok", it->ok}
            });
        }
        return j_list;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

private:
    static constexpr size_t kMaxLogs = 50;

    LogManager() {} // Private constructor
    std::deque<InteractionLog> logs_;
    std::mutex mtx_;
};

}
