#include "block_extractor.hpp"
#include "block_hasher.hpp"
#include <algorithm>
#include <filesystem>
#include <regex>
#include <unordered_map>

namespace code_similarity {

namespace fs = std::filesystem;

namespace {

struct PatternTable {
    std::regex function_start;
    std::regex class_start;
};

const std::unordered_map<std::string, PatternTable>& pattern_tables() {
    // `{` is escaped: ECMAScript std::regex rejects a bare brace outside a quantifier
    static const std::unordered_map<std::string, PatternTable> tables = [] {
        std::unordered_map<std::string, PatternTable> t;
        const std::string js_function = R"(^(function\s+\w+|const\s+\w+\s*=.*=>|\w+\s*\([^)]*\)\s*\{))";
        const std::string jvm_function = R"(^(public|private|protected)?\s*(static)?\s*\w+\s+\w+\s*\()";
        const std::string jvm_class = R"(^(public|private)?\s*class\s+\w+)";

        t.emplace("javascript", PatternTable{std::regex(js_function), std::regex(R"(^class\s+\w+)")});
        t.emplace("typescript", PatternTable{std::regex(js_function), std::regex(R"(^class\s+\w+)")});
        t.emplace("python", PatternTable{std::regex(R"(^def\s+\w+\s*\()"), std::regex(R"(^class\s+\w+)")});
        t.emplace("java", PatternTable{std::regex(jvm_function), std::regex(jvm_class)});
        t.emplace("csharp", PatternTable{std::regex(jvm_function), std::regex(jvm_class)});
        return t;
    }();
    return tables;
}

std::string trim(const std::string& line) {
    const char* ws = " \t\r\n\f\v";
    size_t first = line.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = line.find_last_not_of(ws);
    return line.substr(first, last - first + 1);
}

std::string join_lines(const std::vector<std::string>& lines, size_t from, size_t to) {
    std::string code;
    for (size_t i = from; i <= to; ++i) {
        if (i > from) code += '\n';
        code += lines[i];
    }
    return code;
}

} // namespace

std::string BlockExtractor::detect_language(const std::string& file_path) {
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    static const std::unordered_map<std::string, std::string> language_map = {
        {"js", "javascript"}, {"jsx", "javascript"},
        {"ts", "typescript"}, {"tsx", "typescript"},
        {"py", "python"},
        {"java", "java"},
        {"cs", "csharp"},
        {"cpp", "cpp"},
        {"c", "c"}
    };
    auto it = language_map.find(ext);
    return it != language_map.end() ? it->second : "text";
}

bool BlockExtractor::is_function_start(const std::string& trimmed_line, const std::string& language) {
    auto it = pattern_tables().find(language);
    if (it == pattern_tables().end()) return false;
    return std::regex_search(trimmed_line, it->second.function_start);
}

bool BlockExtractor::is_class_start(const std::string& trimmed_line, const std::string& language) {
    auto it = pattern_tables().find(language);
    if (it == pattern_tables().end()) return false;
    return std::regex_search(trimmed_line, it->second.class_start);
}

std::vector<std::string> BlockExtractor::split_lines(const std::string& content) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (true) {
        size_t next = content.find('\n', pos);
        std::string line = content.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        if (next == std::string::npos) break;
        pos = next + 1;
    }
    return lines;
}

size_t BlockExtractor::find_block_end(const std::vector<std::string>& lines, size_t start_index) {
    if (lines.empty()) return 0;

    int brace_count = 0;
    bool in_string = false;
    char string_char = '\0';

    for (size_t i = start_index; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        for (size_t j = 0; j < line.length(); ++j) {
            char c = line[j];

            if (!in_string && (c == '"' || c == '\'')) {
                in_string = true;
                string_char = c;
            } else if (in_string && c == string_char && (j == 0 || line[j - 1] != '\\')) {
                in_string = false;
                string_char = '\0';
            } else if (!in_string) {
                if (c == '{') brace_count++;
                else if (c == '}') brace_count--;
            }
        }

        if (brace_count == 0 && i > start_index) {
            return i;
        }
    }

    // Truncated file: the block runs to the last line
    return lines.size() - 1;
}

std::vector<CodeBlock> BlockExtractor::extract_blocks(const std::string& content, const std::string& language) {
    std::vector<CodeBlock> blocks;
    if (pattern_tables().find(language) == pattern_tables().end()) return blocks;

    auto lines = split_lines(content);

    auto collect = [&](bool (*is_start)(const std::string&, const std::string&)) {
        for (size_t i = 0; i < lines.size(); ++i) {
            if (!is_start(trim(lines[i]), language)) continue;

            size_t end = find_block_end(lines, i);
            if (end <= i) continue;

            CodeBlock block;
            block.start_line = static_cast<int>(i) + 1;
            block.end_line = static_cast<int>(end) + 1;
            block.code = join_lines(lines, i, end);
            block.hash = BlockHasher::calculate_hash(block.code);
            block.tokens = BlockHasher::tokenize(block.code);
            blocks.push_back(std::move(block));
        }
    };

    collect(&BlockExtractor::is_function_start);
    collect(&BlockExtractor::is_class_start);
    return blocks;
}

std::vector<CodeBlock> BlockExtractor::extract_file_blocks(const std::string& file_path, const std::string& content) {
    auto blocks = extract_blocks(content, detect_language(file_path));
    for (auto& block : blocks) block.file_path = file_path;
    return blocks;
}

} // namespace code_similarity
