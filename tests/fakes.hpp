/**
 * @file fakes.hpp
 * @brief In-memory collaborators for the engine tests
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ai/TextGenerator.hpp"
#include "io/ProjectFileSource.hpp"

namespace code_similarity::fakes {

/**
 * @brief Scripted ITextGenerator
 *
 * Every call goes through the responder. Records call counts per purpose and
 * the peak number of concurrent calls.
 */
class FakeTextGenerator : public ITextGenerator {
public:
    using Responder = std::function<std::string(const std::string& prompt, const std::string& purpose)>;

    explicit FakeTextGenerator(Responder responder, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : responder_(std::move(responder)), delay_(delay) {}

    static std::shared_ptr<FakeTextGenerator> answering(const std::string& answer) {
        return std::make_shared<FakeTextGenerator>([answer](const std::string&, const std::string&) {
            return answer;
        });
    }

    std::string generate_text(const std::string& prompt, const std::string& purpose) override {
        struct Leave {
            std::atomic<int>& counter;
            ~Leave() { --counter; }
        };

        int now = ++in_flight_;
        Leave leave{in_flight_};
        int peak = peak_in_flight_.load();
        while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {}

        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_[purpose]++;
        }
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);

        return responder_(prompt, purpose);
    }

    int calls(const std::string& purpose) {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[purpose];
    }

    int total_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [purpose, count] : calls_) total += count;
        return total;
    }

    int peak_in_flight() const { return peak_in_flight_.load(); }

private:
    Responder responder_;
    std::chrono::milliseconds delay_;
    std::mutex mutex_;
    std::map<std::string, int> calls_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_in_flight_{0};
};

/**
 * @brief IProjectFileSource over a path -> content map
 *
 * Listing returns paths in insertion order. Paths marked unreadable throw on
 * read; an optional gate blocks listing until the test releases it.
 */
class InMemoryFileSource : public IProjectFileSource {
public:
    void add_file(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!contents_.count(path)) order_.push_back(path);
        contents_[path] = content;
    }

    void add_unreadable_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        order_.push_back(path);
        unreadable_.insert(path);
    }

    void fail_listing() { fail_listing_ = true; }

    // Listing signals `entered` and then waits for `release`
    void gate_listing(std::promise<void>* entered, std::shared_future<void> release) {
        entered_ = entered;
        release_ = std::move(release);
    }

    std::vector<std::string> list_project_text_files(const std::string&) override {
        if (entered_) {
            entered_->set_value();
            entered_ = nullptr;
            release_.wait();
        }
        if (fail_listing_) throw std::runtime_error("listing unavailable");

        std::lock_guard<std::mutex> lock(mutex_);
        return order_;
    }

    std::string read_text_file(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unreadable_.count(path)) throw std::runtime_error("permission denied: " + path);
        auto it = contents_.find(path);
        if (it == contents_.end()) throw std::runtime_error("File not found: " + path);
        return it->second;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> contents_;
    std::set<std::string> unreadable_;
    bool fail_listing_ = false;
    std::promise<void>* entered_ = nullptr;
    std::shared_future<void> release_;
};

inline std::string judgment_json(double similarity, const std::string& type = "semantic", double confidence = 0.75) {
    return "{\"similarity\": " + std::to_string(similarity) + ", \"type\": \"" + type +
           "\", \"confidence\": " + std::to_string(confidence) +
           ", \"reasoning\": \"same intent\", \"suggestions\": [\"Merge the two helpers\"]}";
}

} // namespace code_similarity::fakes
