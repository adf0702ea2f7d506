/**
 * @file test_judgment_protocol.cpp
 * @brief Unit tests for prompt construction and tolerant parsing of model answers
 */

#include <gtest/gtest.h>
#include "ai/JudgmentProtocol.hpp"

using code_similarity::CodeBlock;
using code_similarity::JudgmentProtocol;

TEST(JudgmentProtocolTest, SimilarityPromptCarriesBothBlocks) {
    CodeBlock a;
    a.file_path = "src/a.ts";
    a.code = "function a() {}";
    CodeBlock b;
    b.file_path = "src/b.ts";
    b.code = "function b() {}";

    auto prompt = JudgmentProtocol::build_similarity_prompt(a, b);
    EXPECT_NE(prompt.find("Block 1 (src/a.ts)"), std::string::npos);
    EXPECT_NE(prompt.find("Block 2 (src/b.ts)"), std::string::npos);
    EXPECT_NE(prompt.find("function a() {}"), std::string::npos);
    EXPECT_NE(prompt.find("function b() {}"), std::string::npos);
    EXPECT_NE(prompt.find("\"similarity\""), std::string::npos);
}

TEST(JudgmentProtocolTest, PatternPromptNumbersBlocks) {
    auto prompt = JudgmentProtocol::build_pattern_prompt({"first()", "second()"});
    EXPECT_NE(prompt.find("Block 1:\n```\nfirst()"), std::string::npos);
    EXPECT_NE(prompt.find("Block 2:\n```\nsecond()"), std::string::npos);
}

TEST(JudgmentProtocolTest, ExtractsJsonFromFencedProse) {
    auto j = JudgmentProtocol::extract_json("Here you go:\n```json\n{\"similarity\": 0.7}\n```\nThanks");
    ASSERT_TRUE(j.contains("similarity"));
    EXPECT_DOUBLE_EQ(j["similarity"].get<double>(), 0.7);
}

TEST(JudgmentProtocolTest, ExtractKeepsNestedObjects) {
    auto j = JudgmentProtocol::extract_json("{\"outer\": {\"inner\": 1}}");
    EXPECT_EQ(j["outer"]["inner"].get<int>(), 1);
}

TEST(JudgmentProtocolTest, MissingOrBrokenJsonIsEmptyObject) {
    EXPECT_TRUE(JudgmentProtocol::extract_json("no json here").empty());
    EXPECT_TRUE(JudgmentProtocol::extract_json("} backwards {").empty());
    EXPECT_TRUE(JudgmentProtocol::extract_json("{\"similarity\": }").empty());
}

TEST(JudgmentProtocolTest, ParsesFullJudgment) {
    auto judgment = JudgmentProtocol::parse_judgment(
        "{\"similarity\": 0.82, \"type\": \"functional\", \"confidence\": 0.6, "
        "\"reasoning\": \"both sum arrays\", \"suggestions\": [\"extract sum\", 3, \"share util\"]}");

    EXPECT_DOUBLE_EQ(judgment.similarity, 0.82);
    EXPECT_EQ(judgment.type, "functional");
    EXPECT_DOUBLE_EQ(judgment.confidence, 0.6);
    EXPECT_EQ(judgment.reasoning, "both sum arrays");
    EXPECT_EQ(judgment.suggestions, (std::vector<std::string>{"extract sum", "share util"}));
}

TEST(JudgmentProtocolTest, ScoresAreClampedToUnitInterval) {
    auto judgment = JudgmentProtocol::parse_judgment("{\"similarity\": 1.7, \"confidence\": -0.2}");
    EXPECT_DOUBLE_EQ(judgment.similarity, 1.0);
    EXPECT_DOUBLE_EQ(judgment.confidence, 0.0);
}

TEST(JudgmentProtocolTest, WrongTypedFieldsReadAsDefaults) {
    auto judgment = JudgmentProtocol::parse_judgment(
        "{\"similarity\": \"high\", \"type\": 5, \"suggestions\": \"none\"}");
    EXPECT_DOUBLE_EQ(judgment.similarity, 0.0);
    EXPECT_TRUE(judgment.type.empty());
    EXPECT_TRUE(judgment.suggestions.empty());
}

TEST(JudgmentProtocolTest, UnparseableAnswerMeansNoSimilarity) {
    auto judgment = JudgmentProtocol::parse_judgment("The model is overloaded.");
    EXPECT_DOUBLE_EQ(judgment.similarity, 0.0);
    EXPECT_DOUBLE_EQ(judgment.confidence, 0.0);
}
