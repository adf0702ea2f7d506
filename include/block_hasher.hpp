#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace code_similarity {

class BlockHasher {
public:
    // 32-bit polynomial hash (h * 31 + byte, wrapping). Not collision free.
    static std::int32_t calculate_hash(const std::string& code);

    // Lowercase word tokens; punctuation acts as a separator, single-character tokens are dropped.
    static std::vector<std::string> tokenize(const std::string& code);

    // |A ∩ B| / |A ∪ B| over the distinct tokens; 0 when both are empty.
    static double jaccard_similarity(const std::vector<std::string>& tokens1,
                                     const std::vector<std::string>& tokens2);
};

} // namespace code_similarity
