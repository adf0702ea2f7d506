#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace code_similarity {

struct CodeBlock {
    std::string file_path;
    int start_line = 0; // 1-based, inclusive
    int end_line = 0;
    std::string code;
    std::int32_t hash = 0;
    std::vector<std::string> tokens;

    nlohmann::json to_json() const;
};

enum class MatchType { Exact, Structural, Semantic, Functional };

std::string to_string(MatchType type);

using LineRange = std::pair<int, int>;

struct SimilarityMatch {
    std::string id;
    std::string source_file;
    std::string target_file;
    LineRange source_lines{0, 0};
    LineRange target_lines{0, 0};
    std::string source_code;
    std::string target_code;
    double similarity_score = 0.0;
    MatchType match_type = MatchType::Structural;
    double confidence = 0.0;
    std::vector<std::string> suggestions;
    bool refactoring_opportunity = false;

    nlohmann::json to_json() const;
};

enum class RefactoringPriority { High, Medium, Low };

std::string to_string(RefactoringPriority priority);

struct EstimatedSavings {
    int lines_of_code = 0;
    int maintainability_improvement = 0;
};

struct DuplicateCluster {
    std::string id;
    std::vector<std::string> files; // insertion order, no duplicates
    std::vector<CodeBlock> code_blocks;
    std::string common_pattern;
    double average_similarity = 0.0;
    RefactoringPriority refactoring_priority = RefactoringPriority::Low;
    EstimatedSavings estimated_savings;

    nlohmann::json to_json() const;
};

struct SimilarityStatistics {
    int exact_duplicates = 0;
    int structural_similar = 0;
    int semantic_similar = 0;
    int functional_similar = 0;
    int potential_savings = 0;
};

struct SimilarityReport {
    std::string id;
    std::string project_path;
    long long timestamp = 0; // epoch ms
    int total_files = 0;
    int total_matches = 0;
    std::vector<DuplicateCluster> duplicate_clusters;
    std::vector<SimilarityMatch> similarity_matches;
    SimilarityStatistics statistics;

    nlohmann::json to_json() const;
};

} // namespace code_similarity
