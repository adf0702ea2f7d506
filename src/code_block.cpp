#include "code_block.hpp"

namespace code_similarity {

using json = nlohmann::json;

std::string to_string(MatchType type) {
    switch (type) {
        case MatchType::Exact: return "exact";
        case MatchType::Structural: return "structural";
        case MatchType::Semantic: return "semantic";
        case MatchType::Functional: return "functional";
    }
    return "structural";
}

std::string to_string(RefactoringPriority priority) {
    switch (priority) {
        case RefactoringPriority::High: return "high";
        case RefactoringPriority::Medium: return "medium";
        case RefactoringPriority::Low: return "low";
    }
    return "low";
}

json CodeBlock::to_json() const {
    return json{
        {"filePath", file_path},
        {"startLine", start_line},
        {"endLine", end_line},
        {"code", code},
        {"hash", std::to_string(hash)},
        {"tokens", tokens}
    };
}

json SimilarityMatch::to_json() const {
    return json{
        {"id", id},
        {"sourceFile", source_file},
        {"targetFile", target_file},
        {"sourceLines", {source_lines.first, source_lines.second}},
        {"targetLines", {target_lines.first, target_lines.second}},
        {"sourceCode", source_code},
        {"targetCode", target_code},
        {"similarityScore", similarity_score},
        {"matchType", to_string(match_type)},
        {"confidence", confidence},
        {"suggestions", suggestions},
        {"refactoringOpportunity", refactoring_opportunity}
    };
}

json DuplicateCluster::to_json() const {
    json blocks = json::array();
    for (const auto& block : code_blocks) blocks.push_back(block.to_json());

    return json{
        {"id", id},
        {"files", files},
        {"codeBlocks", blocks},
        {"commonPattern", common_pattern},
        {"averageSimilarity", average_similarity},
        {"refactoringPriority", to_string(refactoring_priority)},
        {"estimatedSavings", {
            {"linesOfCode", estimated_savings.lines_of_code},
            {"maintainabilityImprovement", estimated_savings.maintainability_improvement}
        }}
    };
}

json SimilarityReport::to_json() const {
    json clusters = json::array();
    for (const auto& cluster : duplicate_clusters) clusters.push_back(cluster.to_json());

    json matches = json::array();
    for (const auto& match : similarity_matches) matches.push_back(match.to_json());

    return json{
        {"id", id},
        {"projectPath", project_path},
        {"timestamp", timestamp},
        {"totalFiles", total_files},
        {"totalMatches", total_matches},
        {"duplicateClusters", clusters},
        {"similarityMatches", matches},
        {"statistics", {
            {"exactDuplicates", statistics.exact_duplicates},
            {"structuralSimilar", statistics.structural_similar},
            {"semanticSimilar", statistics.semantic_similar},
            {"functionalSimilar", statistics.functional_similar},
            {"potentialSavings", statistics.potential_savings}
        }}
    };
}

} // namespace code_similarity
