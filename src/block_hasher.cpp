#include "block_hasher.hpp"
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace code_similarity {

std::int32_t BlockHasher::calculate_hash(const std::string& code) {
    std::uint32_t hash = 0;
    for (unsigned char c : code) {
        hash = (hash << 5) - hash + c;
    }
    return static_cast<std::int32_t>(hash);
}

std::vector<std::string> BlockHasher::tokenize(const std::string& code) {
    std::string cleaned;
    cleaned.reserve(code.size());
    for (unsigned char c : code) {
        // Only ASCII word characters survive, everything else splits tokens
        bool word = c < 0x80 && (std::isalnum(c) || c == '_');
        cleaned += word ? static_cast<char>(std::tolower(c)) : ' ';
    }

    std::vector<std::string> tokens;
    std::istringstream stream(cleaned);
    std::string token;
    while (stream >> token) {
        if (token.length() > 1) tokens.push_back(token);
    }
    return tokens;
}

double BlockHasher::jaccard_similarity(const std::vector<std::string>& tokens1,
                                       const std::vector<std::string>& tokens2) {
    std::unordered_set<std::string> set1(tokens1.begin(), tokens1.end());
    std::unordered_set<std::string> set2(tokens2.begin(), tokens2.end());

    size_t intersection = 0;
    for (const auto& token : set1) {
        if (set2.count(token)) intersection++;
    }
    size_t union_size = set1.size() + set2.size() - intersection;

    return union_size > 0 ? static_cast<double>(intersection) / static_cast<double>(union_size) : 0.0;
}

} // namespace code_similarity
