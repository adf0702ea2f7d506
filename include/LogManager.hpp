#pragma once
#include <deque>
#include <mutex>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>

namespace code_similarity {

struct InteractionLog {
    long long timestamp;
    std::string purpose;     // "semantic_judgment" or "pattern_extraction"
    std::string prompt;
    std::string response;    // model text, or the error on failure
    bool success;
    double duration_ms;
};

class LogManager {
public:
    static constexpr size_t kMaxEntries = 50;

    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(const InteractionLog& log) {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(log);
        if (logs_.size() > kMaxEntries) {
            logs_.pop_front();
        }
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return logs_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
    }

    nlohmann::json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j_list = nlohmann::json::array();
        // Newest first
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"purpose", it->purpose},
                {"prompt", it->prompt},
                {"response", it->response},
                {"success", it->success},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

private:
    LogManager() {}
    std::deque<InteractionLog> logs_;
    std::mutex mtx_;
};

} // namespace code_similarity
