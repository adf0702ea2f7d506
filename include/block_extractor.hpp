#pragma once

#include <string>
#include <vector>
#include "code_block.hpp"

namespace code_similarity {

// Heuristic line scanner. Finds function and class starts with per-language
// regexes and closes them with a string-aware brace counter. Not a parser.
class BlockExtractor {
public:
    // "javascript", "typescript", "python", "java", "csharp", "cpp", "c" or "text"
    static std::string detect_language(const std::string& file_path);

    // Blocks carry hash and tokens; file_path is left empty for the caller.
    static std::vector<CodeBlock> extract_blocks(const std::string& content, const std::string& language);

    // Convenience: detect the language from the path and attach it to every block.
    static std::vector<CodeBlock> extract_file_blocks(const std::string& file_path, const std::string& content);

    static bool is_function_start(const std::string& trimmed_line, const std::string& language);
    static bool is_class_start(const std::string& trimmed_line, const std::string& language);

    // Index of the line where brace depth returns to zero after start_index,
    // or the last line when the file ends first. Indices are 0-based.
    static size_t find_block_end(const std::vector<std::string>& lines, size_t start_index);

    static std::vector<std::string> split_lines(const std::string& content);
};

} // namespace code_similarity
