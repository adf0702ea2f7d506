#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_similarity {

class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    size_t current_index = 0;
    std::string primary_model = "gemini-1.5-flash";

public:
    KeyManager() {
        refresh_key_pool();
    }

    explicit KeyManager(const std::string& keys_path) {
        load_from(keys_path);
    }

    void refresh_key_pool() {
        std::vector<std::string> search_paths = {
            "keys.json",
            "../keys.json",
            "build/keys.json",
            "Release/keys.json",
            "../../keys.json"
        };

        for (const auto& path : search_paths) {
            std::ifstream probe(path);
            if (probe.is_open()) {
                load_from(path);
                return;
            }
        }
        spdlog::error("🚨 keys.json not found in any standard path, model calls will fail");
    }

    void load_from(const std::string& path) {
        std::unique_lock lock(pool_mutex);

        std::ifstream f(path);
        if (!f.is_open()) {
            spdlog::error("🚨 Key file {} could not be opened", path);
            return;
        }

        try {
            auto j = nlohmann::json::parse(f);

            key_pool.clear();
            for (auto& k : j.value("keys", nlohmann::json::array())) {
                key_pool.push_back({k.get<std::string>(), true, 0});
            }
            current_index = 0;
            primary_model = j.value("primary", "gemini-1.5-flash");

            spdlog::info("🔑 Key pool loaded from {}: {} keys, model {}", path, key_pool.size(), primary_model);
        } catch (const std::exception& e) {
            spdlog::error("💥 Failed to parse key file {}: {}", path, e.what());
        }
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) {
            if (k.is_active) count++;
        }
        return count;
    }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";
        return key_pool[current_index % key_pool.size()].key;
    }

    std::string get_current_model() const {
        std::shared_lock lock(pool_mutex);
        return primary_model;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        auto& current = key_pool[current_index % key_pool.size()];
        current.fail_count++;
        if (current.fail_count > 2) {
            current.is_active = false;
            spdlog::warn("⚠️ Key #{} decommissioned", current_index);
        }
        current_index = (current_index + 1) % key_pool.size();
    }
};

} // namespace code_similarity
