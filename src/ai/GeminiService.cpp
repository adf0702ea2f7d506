#include "ai/GeminiService.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>
#include <ctime>
#include <stdexcept>
#include "LogManager.hpp"

namespace code_similarity {

using json = nlohmann::json;

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    while (!sub.empty()) {
        unsigned char c = static_cast<unsigned char>(sub.back());
        if (c < 0x80) break;
        if (c >= 0xC0) { sub.pop_back(); break; }
        sub.pop_back();
    }
    return sub;
}

GeminiService::GeminiService(std::shared_ptr<KeyManager> key_manager, int timeout_ms)
    : key_manager_(key_manager), response_cache_(std::make_shared<ResponseCache>()), timeout_ms_(timeout_ms) {}

std::string GeminiService::get_endpoint_url() {
    return base_url_ + key_manager_->get_current_model() + ":generateContent?key=" + key_manager_->get_current_key();
}

template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, std::shared_ptr<KeyManager> km) {
    int max_retries = 4;
    cpr::Response r;
    for (int i = 0; i < max_retries; ++i) {
        r = request_factory();
        if (r.status_code == 200) return r;
        if ((r.status_code == 429 || r.status_code == 503) && km) {
            spdlog::warn("⚠️ API {} ({}). Rotating key and cooling down (Attempt {}/{})...",
                         r.status_code, (r.status_code == 429 ? "Quota" : "Overload"), i + 1, max_retries);

            km->report_rate_limit();
            std::this_thread::sleep_for(std::chrono::milliseconds(2000 + (i * 1000)));
            continue;
        }
        break;
    }
    return r;
}

std::string GeminiService::generate_text(const std::string& prompt, const std::string& purpose) {
    if (auto cached = response_cache_->get(prompt)) {
        spdlog::debug("Cache hit for {} ({} hits so far)", purpose, response_cache_->hits());
        return *cached;
    }

    auto start = std::chrono::high_resolution_clock::now();
    auto record = [&](const std::string& response, bool success) {
        double duration = std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start).count();
        LogManager::instance().add_log({
            static_cast<long long>(std::time(nullptr)), purpose, prompt, response, success, duration
        });
    };

    std::string payload = json{
        {"contents", {{ {"parts", {{{"text", prompt}}}} }}}
    }.dump(-1, ' ', false, json::error_handler_t::replace);

    // The URL is rebuilt per attempt so a rotated key is picked up
    auto r = perform_request_with_retry([&]() {
        return cpr::Post(cpr::Url{get_endpoint_url()},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"}},
                         cpr::Timeout{timeout_ms_});
    }, key_manager_);

    if (r.status_code != 200) {
        std::string detail = r.error.message.empty() ? utf8_safe_substr(r.text, 300) : r.error.message;
        spdlog::error("❌ Model API error [{}] during {}: {}", r.status_code, purpose, detail);
        record(detail, false);
        throw std::runtime_error("Model request failed with status " + std::to_string(r.status_code));
    }

    std::string text;
    try {
        auto response_json = json::parse(r.text);
        text = response_json.at("candidates").at(0).at("content").at("parts").at(0).at("text").get<std::string>();
    } catch (const json::exception& e) {
        record(utf8_safe_substr(r.text, 300), false);
        throw std::runtime_error(std::string("Unexpected model response shape: ") + e.what());
    }

    record(text, true);
    response_cache_->put(prompt, text);
    return text;
}

} // namespace code_similarity
