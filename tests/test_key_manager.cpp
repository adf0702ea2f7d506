/**
 * @file test_key_manager.cpp
 * @brief Unit tests for key pool loading and rotation on rate limits
 */

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "KeyManager.hpp"

namespace fs = std::filesystem;
using code_similarity::KeyManager;

class KeyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = fs::temp_directory_path() /
               ("code_similarity_keys_" + std::to_string(
                    std::chrono::steady_clock::now().time_since_epoch().count()) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    fs::path path;
};

TEST_F(KeyManagerTest, LoadsKeysAndModel) {
    write(R"({"keys": ["k1", "k2"], "primary": "gemini-2.0-flash"})");
    KeyManager km(path.string());

    EXPECT_EQ(km.get_active_key_count(), 2u);
    EXPECT_EQ(km.get_current_key(), "k1");
    EXPECT_EQ(km.get_current_model(), "gemini-2.0-flash");
}

TEST_F(KeyManagerTest, RateLimitRotatesAndEventuallyDeactivates) {
    write(R"({"keys": ["k1", "k2"]})");
    KeyManager km(path.string());

    km.report_rate_limit();
    EXPECT_EQ(km.get_current_key(), "k2");
    km.report_rate_limit();
    EXPECT_EQ(km.get_current_key(), "k1");

    // Third strike on k1
    km.report_rate_limit();
    km.report_rate_limit();
    km.report_rate_limit();
    EXPECT_EQ(km.get_active_key_count(), 1u);
}

TEST_F(KeyManagerTest, MissingOrBrokenFileLeavesEmptyPool) {
    KeyManager missing(path.string());
    EXPECT_EQ(missing.get_current_key(), "");
    EXPECT_EQ(missing.get_current_model(), "gemini-1.5-flash");

    write("{ broken");
    KeyManager broken(path.string());
    EXPECT_EQ(broken.get_active_key_count(), 0u);
}
