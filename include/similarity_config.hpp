#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_similarity {

struct SimilarityConfig {
    double structural_threshold = 0.7;
    double semantic_threshold = 0.6;
    double refactoring_threshold = 0.8;
    double compare_threshold = 0.7;
    size_t semantic_batch_size = 10;
    size_t max_concurrent_judgments = 10; // model calls in flight at once
    bool enable_semantic = true;
    bool enable_pattern_extraction = true;
    double savings_reduction_ratio = 0.7;
    int maintainability_per_match = 10;

    static SimilarityConfig from_json(const nlohmann::json& j);
};

struct ProjectFilter {
    std::vector<std::string> allowed_extensions; // dot-free, lowercase
    std::vector<std::string> ignored_paths;
    std::vector<std::string> included_paths;     // exceptions inside ignored paths
    size_t max_file_bytes = 512 * 1024;

    static ProjectFilter defaults();
    static ProjectFilter from_json(const nlohmann::json& j);
};

struct ProjectConfig {
    ProjectFilter filter = ProjectFilter::defaults();
    SimilarityConfig similarity;

    // Reads <root>/.code_similarity/config.json, then <root>/config.json.
    // A missing or corrupted file yields defaults.
    static ProjectConfig load(const std::string& root_path);
};

} // namespace code_similarity
