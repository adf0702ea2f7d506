#pragma once
#include <memory>
#include <string>
#include "ai/TextGenerator.hpp"
#include "ai/ResponseCache.hpp"
#include "KeyManager.hpp"

namespace code_similarity {

std::string utf8_safe_substr(const std::string& str, size_t length);

class GeminiService : public ITextGenerator {
public:
    explicit GeminiService(std::shared_ptr<KeyManager> key_manager, int timeout_ms = 60000);

    // Throws std::runtime_error when every attempt fails or the answer has no text part.
    std::string generate_text(const std::string& prompt, const std::string& purpose) override;

    ResponseCache& cache() { return *response_cache_; }

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::shared_ptr<ResponseCache> response_cache_;
    int timeout_ms_;
    const std::string base_url_ = "https://generativelanguage.googleapis.com/v1beta/models/";

    std::string get_endpoint_url();
};

} // namespace code_similarity
