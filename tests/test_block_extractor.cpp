/**
 * @file test_block_extractor.cpp
 * @brief Unit tests for the line scanner: start patterns, block-end scanning, languages
 */

#include <gtest/gtest.h>
#include "block_extractor.hpp"
#include "block_hasher.hpp"

using code_similarity::BlockExtractor;
using code_similarity::BlockHasher;

TEST(BlockExtractorTest, DetectsLanguageFromExtension) {
    EXPECT_EQ(BlockExtractor::detect_language("src/app.ts"), "typescript");
    EXPECT_EQ(BlockExtractor::detect_language("src/View.TSX"), "typescript");
    EXPECT_EQ(BlockExtractor::detect_language("lib/util.js"), "javascript");
    EXPECT_EQ(BlockExtractor::detect_language("lib/widget.jsx"), "javascript");
    EXPECT_EQ(BlockExtractor::detect_language("tools/run.py"), "python");
    EXPECT_EQ(BlockExtractor::detect_language("Main.java"), "java");
    EXPECT_EQ(BlockExtractor::detect_language("Program.cs"), "csharp");
    EXPECT_EQ(BlockExtractor::detect_language("engine.cpp"), "cpp");
    EXPECT_EQ(BlockExtractor::detect_language("driver.c"), "c");
    EXPECT_EQ(BlockExtractor::detect_language("README.md"), "text");
    EXPECT_EQ(BlockExtractor::detect_language("Makefile"), "text");
}

TEST(BlockExtractorTest, ExtractsSimpleFunction) {
    std::string content =
        "import x from 'y';\n"
        "function add(a, b) {\n"
        "  return a + b;\n"
        "}\n";

    auto blocks = BlockExtractor::extract_blocks(content, "typescript");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start_line, 2);
    EXPECT_EQ(blocks[0].end_line, 4);
    EXPECT_EQ(blocks[0].code, "function add(a, b) {\n  return a + b;\n}");
    EXPECT_EQ(blocks[0].hash, BlockHasher::calculate_hash(blocks[0].code));
    EXPECT_EQ(blocks[0].tokens, BlockHasher::tokenize(blocks[0].code));
    EXPECT_TRUE(blocks[0].file_path.empty());
}

TEST(BlockExtractorTest, ArrowFunctionAssignmentIsABlockStart) {
    std::string content =
        "const double = (n) => {\n"
        "  return n * 2;\n"
        "};\n";

    auto blocks = BlockExtractor::extract_blocks(content, "javascript");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start_line, 1);
    EXPECT_EQ(blocks[0].end_line, 3);
}

TEST(BlockExtractorTest, FunctionBlocksComeBeforeClassBlocks) {
    std::string content =
        "class Greeter {\n"
        "  greet(name) {\n"
        "    return name;\n"
        "  }\n"
        "}\n";

    auto blocks = BlockExtractor::extract_blocks(content, "typescript");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].start_line, 2);
    EXPECT_EQ(blocks[0].end_line, 4);
    EXPECT_EQ(blocks[1].start_line, 1);
    EXPECT_EQ(blocks[1].end_line, 5);
}

TEST(BlockExtractorTest, BracesInsideStringsAreIgnored) {
    std::vector<std::string> lines = {
        "function f() {",
        "  const open = \"{{\";",
        "  const close = '}';",
        "  return open + close;",
        "}",
        "const after = 1;"
    };
    EXPECT_EQ(BlockExtractor::find_block_end(lines, 0), 4u);
}

TEST(BlockExtractorTest, EscapedQuoteDoesNotCloseString) {
    std::vector<std::string> lines = {
        "function f() {",
        "  const s = \"a\\\"}\";",
        "  return s;",
        "}"
    };
    EXPECT_EQ(BlockExtractor::find_block_end(lines, 0), 3u);
}

TEST(BlockExtractorTest, OtherQuoteInsideStringDoesNotToggle) {
    std::vector<std::string> lines = {
        "function f() {",
        "  const s = \"it's }\";",
        "  return s;",
        "}"
    };
    EXPECT_EQ(BlockExtractor::find_block_end(lines, 0), 3u);
}

TEST(BlockExtractorTest, SingleLineBodyEndsOnTheFollowingLine) {
    // The end is searched strictly after the start line
    std::vector<std::string> lines = {
        "function f() { return 1; }",
        "const x = 2;",
        "const y = 3;"
    };
    EXPECT_EQ(BlockExtractor::find_block_end(lines, 0), 1u);
}

TEST(BlockExtractorTest, TruncatedFileRunsToLastLine) {
    std::string content =
        "function broken() {\n"
        "  if (x) {\n"
        "    return 1;";

    auto blocks = BlockExtractor::extract_blocks(content, "javascript");
    ASSERT_FALSE(blocks.empty());
    EXPECT_EQ(blocks[0].start_line, 1);
    EXPECT_EQ(blocks[0].end_line, 3);
}

TEST(BlockExtractorTest, StartOnLastLineProducesNoBlock) {
    auto blocks = BlockExtractor::extract_blocks("function tail() {", "javascript");
    EXPECT_TRUE(blocks.empty());
}

TEST(BlockExtractorTest, PythonDefEndsOnNextLine) {
    std::string content =
        "def scale(x):\n"
        "    return x * 2\n";

    auto blocks = BlockExtractor::extract_blocks(content, "python");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start_line, 1);
    EXPECT_EQ(blocks[0].end_line, 2);
}

TEST(BlockExtractorTest, JavaMethodAndClass) {
    std::string content =
        "public class MathUtil {\n"
        "    public static int sum(int a, int b) {\n"
        "        return a + b;\n"
        "    }\n"
        "}\n";

    auto blocks = BlockExtractor::extract_blocks(content, "java");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].start_line, 2);
    EXPECT_EQ(blocks[0].end_line, 4);
    EXPECT_EQ(blocks[1].start_line, 1);
    EXPECT_EQ(blocks[1].end_line, 5);
}

TEST(BlockExtractorTest, UnknownLanguagesYieldNoBlocks) {
    std::string content = "int main() {\n  return 0;\n}\n";
    EXPECT_TRUE(BlockExtractor::extract_blocks(content, "cpp").empty());
    EXPECT_TRUE(BlockExtractor::extract_blocks(content, "text").empty());
}

TEST(BlockExtractorTest, CrlfAndLfProduceTheSameBlock) {
    auto lf = BlockExtractor::extract_blocks("function f() {\n  return 1;\n}\n", "javascript");
    auto crlf = BlockExtractor::extract_blocks("function f() {\r\n  return 1;\r\n}\r\n", "javascript");
    ASSERT_EQ(lf.size(), 1u);
    ASSERT_EQ(crlf.size(), 1u);
    EXPECT_EQ(lf[0].hash, crlf[0].hash);
}

TEST(BlockExtractorTest, FileBlocksCarryThePath) {
    auto blocks = BlockExtractor::extract_file_blocks("src/a.ts", "function f() {\n  return 1;\n}\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].file_path, "src/a.ts");
}

TEST(BlockExtractorTest, SplitLinesKeepsTrailingEmptyLine) {
    auto lines = BlockExtractor::split_lines("a\nb\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "");
}
