/**
 * @file test_log_manager.cpp
 * @brief Unit tests for the bounded model interaction log
 */

#include <gtest/gtest.h>
#include "LogManager.hpp"

using code_similarity::InteractionLog;
using code_similarity::LogManager;

TEST(LogManagerTest, KeepsNewestEntriesUpToCapacity) {
    auto& logs = LogManager::instance();
    logs.clear();

    for (int i = 0; i < 60; ++i) {
        logs.add_log({i, "semantic_judgment", "prompt " + std::to_string(i), "answer", true, 1.5});
    }

    EXPECT_EQ(logs.size(), LogManager::kMaxEntries);
    auto j = logs.get_logs_json();
    ASSERT_EQ(j.size(), 50u);
    EXPECT_EQ(j[0]["timestamp"].get<long long>(), 59);
    EXPECT_EQ(j[49]["timestamp"].get<long long>(), 10);
    EXPECT_EQ(j[0]["purpose"], "semantic_judgment");
    EXPECT_TRUE(j[0]["success"].get<bool>());

    logs.clear();
    EXPECT_EQ(logs.size(), 0u);
}

TEST(LogManagerTest, FailuresAreRecorded) {
    auto& logs = LogManager::instance();
    logs.clear();

    logs.add_log({1, "pattern_extraction", "prompt", "quota exhausted", false, 12.0});
    auto j = logs.get_logs_json();
    ASSERT_EQ(j.size(), 1u);
    EXPECT_FALSE(j[0]["success"].get<bool>());
    EXPECT_EQ(j[0]["response"], "quota exhausted");
    logs.clear();
}
