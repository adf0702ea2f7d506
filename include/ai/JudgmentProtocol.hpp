#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_block.hpp"

namespace code_similarity {

struct SemanticJudgment {
    double similarity = 0.0;
    std::string type;        // "functional", "algorithmic" or "semantic"
    double confidence = 0.0;
    std::string reasoning;
    std::vector<std::string> suggestions;
};

class JudgmentProtocol {
public:
    static std::string build_similarity_prompt(const CodeBlock& block1, const CodeBlock& block2);
    static std::string build_pattern_prompt(const std::vector<std::string>& codes);

    // Outermost {...} span of a free-text answer; an empty object when absent or malformed.
    static nlohmann::json extract_json(const std::string& raw);

    // Never throws. Unparseable answers read as "no similarity" (score 0).
    static SemanticJudgment parse_judgment(const std::string& raw);
};

} // namespace code_similarity
