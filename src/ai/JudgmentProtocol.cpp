#include "ai/JudgmentProtocol.hpp"
#include <algorithm>
#include <sstream>

namespace code_similarity {

using json = nlohmann::json;

namespace {

double unit_number(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0.0;
    return std::min(1.0, std::max(0.0, it->get<double>()));
}

} // namespace

std::string JudgmentProtocol::build_similarity_prompt(const CodeBlock& block1, const CodeBlock& block2) {
    std::ostringstream prompt;
    prompt << "Compare these two code blocks for semantic similarity:\n\n"
           << "Block 1 (" << block1.file_path << "):\n```\n" << block1.code << "\n```\n\n"
           << "Block 2 (" << block2.file_path << "):\n```\n" << block2.code << "\n```\n\n"
           << "Analyze:\n"
           << "1. Functional similarity (do they accomplish the same thing?)\n"
           << "2. Algorithmic similarity (similar approach/logic?)\n"
           << "3. Semantic similarity (similar meaning/purpose?)\n\n"
           << "Return a JSON object with:\n"
           << "{\n"
           << "  \"similarity\": 0.0-1.0,\n"
           << "  \"type\": \"functional|algorithmic|semantic\",\n"
           << "  \"confidence\": 0.0-1.0,\n"
           << "  \"reasoning\": \"explanation\",\n"
           << "  \"suggestions\": [\"suggestion1\", \"suggestion2\"]\n"
           << "}";
    return prompt.str();
}

std::string JudgmentProtocol::build_pattern_prompt(const std::vector<std::string>& codes) {
    std::ostringstream prompt;
    prompt << "Analyze these code blocks and extract the common pattern:\n\n";
    for (size_t i = 0; i < codes.size(); ++i) {
        prompt << "Block " << (i + 1) << ":\n```\n" << codes[i] << "\n```\n\n";
    }
    prompt << "Identify the common algorithmic or structural pattern and describe it concisely.";
    return prompt.str();
}

json JudgmentProtocol::extract_json(const std::string& raw) {
    size_t first = raw.find('{');
    size_t last = raw.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        return json::object();
    }

    auto parsed = json::parse(raw.substr(first, last - first + 1), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return json::object();
    return parsed;
}

SemanticJudgment JudgmentProtocol::parse_judgment(const std::string& raw) {
    SemanticJudgment judgment;
    auto j = extract_json(raw);

    judgment.similarity = unit_number(j, "similarity");
    judgment.confidence = unit_number(j, "confidence");

    auto type = j.find("type");
    if (type != j.end() && type->is_string()) judgment.type = type->get<std::string>();

    auto reasoning = j.find("reasoning");
    if (reasoning != j.end() && reasoning->is_string()) judgment.reasoning = reasoning->get<std::string>();

    auto suggestions = j.find("suggestions");
    if (suggestions != j.end() && suggestions->is_array()) {
        for (const auto& s : *suggestions) {
            if (s.is_string()) judgment.suggestions.push_back(s.get<std::string>());
        }
    }
    return judgment;
}

} // namespace code_similarity
