#pragma once
#include <string>

namespace code_similarity {

// Single-shot prompt -> text capability. Implementations throw on failure
// and must tolerate concurrent calls.
class ITextGenerator {
public:
    virtual ~ITextGenerator() = default;
    virtual std::string generate_text(const std::string& prompt, const std::string& purpose) = 0;
};

} // namespace code_similarity
