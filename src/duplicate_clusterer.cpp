#include "duplicate_clusterer.hpp"
#include "block_hasher.hpp"
#include "ai/JudgmentProtocol.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <utility>
#include <spdlog/spdlog.h>

namespace code_similarity {

namespace {

const char* kFallbackPattern = "Similar code structure";

CodeBlock seed_block(const std::string& file, const LineRange& lines, const std::string& code) {
    CodeBlock block;
    block.file_path = file;
    block.start_line = lines.first;
    block.end_line = lines.second;
    block.code = code;
    block.hash = BlockHasher::calculate_hash(code);
    block.tokens = BlockHasher::tokenize(code);
    return block;
}

void add_unique(std::vector<std::string>& files, const std::string& file) {
    if (std::find(files.begin(), files.end(), file) == files.end()) files.push_back(file);
}

} // namespace

DuplicateClusterer::DuplicateClusterer(std::shared_ptr<ITextGenerator> generator, SimilarityConfig config)
    : generator_(std::move(generator)), config_(config) {}

RefactoringPriority DuplicateClusterer::calculate_priority(double score) {
    if (score >= 0.9) return RefactoringPriority::High;
    if (score >= 0.7) return RefactoringPriority::Medium;
    return RefactoringPriority::Low;
}

EstimatedSavings DuplicateClusterer::calculate_savings(const SimilarityMatch& seed, size_t absorbed_count) const {
    int total_lines = seed.source_lines.second - seed.source_lines.first + 1;

    EstimatedSavings savings;
    savings.lines_of_code = static_cast<int>(std::floor(total_lines * config_.savings_reduction_ratio));
    savings.maintainability_improvement = static_cast<int>(absorbed_count) * config_.maintainability_per_match;
    return savings;
}

std::string DuplicateClusterer::extract_common_pattern(const std::vector<std::string>& codes) {
    if (!generator_ || !config_.enable_pattern_extraction) return kFallbackPattern;

    try {
        std::string answer = generator_->generate_text(JudgmentProtocol::build_pattern_prompt(codes),
                                                       "pattern_extraction");
        if (answer.find_first_not_of(" \t\r\n") == std::string::npos) return "Common pattern detected";
        return answer;
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Pattern extraction failed, using fallback: {}", e.what());
        return kFallbackPattern;
    } catch (...) {
        spdlog::warn("⚠️ Pattern extraction failed with a non-standard exception, using fallback");
        return kFallbackPattern;
    }
}

std::vector<DuplicateCluster> DuplicateClusterer::cluster(const std::vector<SimilarityMatch>& matches) {
    std::vector<DuplicateCluster> clusters;
    std::vector<bool> processed(matches.size(), false);
    auto run_stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    for (size_t i = 0; i < matches.size(); ++i) {
        if (processed[i]) continue;
        const auto& seed = matches[i];

        DuplicateCluster cluster;
        cluster.id = "cluster-" + std::to_string(run_stamp) + "-" + std::to_string(clusters.size());
        add_unique(cluster.files, seed.source_file);
        add_unique(cluster.files, seed.target_file);
        cluster.code_blocks.push_back(seed_block(seed.source_file, seed.source_lines, seed.source_code));
        cluster.code_blocks.push_back(seed_block(seed.target_file, seed.target_lines, seed.target_code));

        // One hop: only the seed's own two files pull matches in
        size_t absorbed = 0;
        double score_sum = 0.0;
        for (size_t j = i; j < matches.size(); ++j) {
            if (processed[j]) continue;
            const auto& m = matches[j];
            bool related = m.source_file == seed.source_file || m.source_file == seed.target_file ||
                           m.target_file == seed.source_file || m.target_file == seed.target_file;
            if (!related) continue;

            add_unique(cluster.files, m.source_file);
            add_unique(cluster.files, m.target_file);
            score_sum += m.similarity_score;
            absorbed++;
            processed[j] = true;
        }

        cluster.common_pattern = extract_common_pattern({seed.source_code, seed.target_code});
        cluster.average_similarity = score_sum / static_cast<double>(absorbed);
        cluster.refactoring_priority = calculate_priority(seed.similarity_score);
        cluster.estimated_savings = calculate_savings(seed, absorbed);

        clusters.push_back(std::move(cluster));
    }

    std::stable_sort(clusters.begin(), clusters.end(), [](const auto& a, const auto& b) {
        return a.average_similarity > b.average_similarity;
    });

    spdlog::info("Clustered {} matches into {} clusters", matches.size(), clusters.size());
    return clusters;
}

} // namespace code_similarity
