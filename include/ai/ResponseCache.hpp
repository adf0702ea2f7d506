#pragma once
#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace code_similarity {

// Model answers keyed by the exact prompt text. Identical block pairs across
// runs are judged once per TTL window. Prompts embed whole code blocks, so
// each one is stored once as the map key and the recency list points at it.
class ResponseCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit ResponseCache(size_t capacity = 1000, std::chrono::seconds ttl = std::chrono::hours(1))
        : capacity_(capacity == 0 ? 1 : capacity), ttl_(ttl) {}

    std::optional<std::string> get(const std::string& prompt) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(prompt);
        if (it == entries_.end()) {
            misses_++;
            return std::nullopt;
        }
        if (Clock::now() - it->second.stored_at > ttl_) {
            recency_.erase(it->second.recency);
            entries_.erase(it);
            misses_++;
            return std::nullopt;
        }

        recency_.splice(recency_.begin(), recency_, it->second.recency);
        hits_++;
        return it->second.answer;
    }

    void put(const std::string& prompt, std::string answer) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(prompt);
        if (it != entries_.end()) {
            it->second.answer = std::move(answer);
            it->second.stored_at = Clock::now();
            recency_.splice(recency_.begin(), recency_, it->second.recency);
            return;
        }

        if (entries_.size() >= capacity_) {
            entries_.erase(*recency_.back());
            recency_.pop_back();
        }

        auto inserted = entries_.emplace(prompt, Entry{std::move(answer), Clock::now(), {}}).first;
        recency_.push_front(&inserted->first);
        inserted->second.recency = recency_.begin();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t hits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_;
    }

    size_t misses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return misses_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        recency_.clear();
    }

private:
    struct Entry {
        std::string answer;
        Clock::time_point stored_at;
        std::list<const std::string*>::iterator recency;
    };

    size_t capacity_;
    std::chrono::seconds ttl_;
    // Node-based map: key addresses survive rehashing
    std::unordered_map<std::string, Entry> entries_;
    std::list<const std::string*> recency_; // front = most recently used
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace code_similarity
