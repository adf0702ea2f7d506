#include "similarity_engine.hpp"
#include "block_hasher.hpp"
#include "ai/JudgmentProtocol.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>

namespace code_similarity {

SimilarityEngine::SimilarityEngine(std::shared_ptr<ITextGenerator> generator, SimilarityConfig config)
    : generator_(std::move(generator)), config_(config)
{
    // Both drive loop strides in the semantic pass
    config_.semantic_batch_size = std::max<size_t>(1, config_.semantic_batch_size);
    config_.max_concurrent_judgments = std::max<size_t>(1, config_.max_concurrent_judgments);
}

SimilarityMatch SimilarityEngine::make_match(
    const std::string& id_prefix,
    const CodeBlock& block1,
    const CodeBlock& block2,
    double score,
    MatchType type,
    double confidence,
    std::vector<std::string> suggestions) const
{
    SimilarityMatch match;
    match.id = id_prefix + block1.file_path + "-" + std::to_string(block1.start_line) + "-" +
               block2.file_path + "-" + std::to_string(block2.start_line);
    match.source_file = block1.file_path;
    match.target_file = block2.file_path;
    match.source_lines = {block1.start_line, block1.end_line};
    match.target_lines = {block2.start_line, block2.end_line};
    match.source_code = block1.code;
    match.target_code = block2.code;
    match.similarity_score = score;
    match.match_type = type;
    match.confidence = confidence;
    match.suggestions = std::move(suggestions);
    match.refactoring_opportunity = score >= config_.refactoring_threshold;
    return match;
}

std::vector<SimilarityMatch> SimilarityEngine::find_exact_duplicates(const std::vector<CodeBlock>& blocks) const {
    // Groups in first-seen order so the output is stable across runs
    std::vector<std::vector<const CodeBlock*>> groups;
    std::unordered_map<std::int32_t, size_t> group_index;

    for (const auto& block : blocks) {
        auto it = group_index.find(block.hash);
        if (it == group_index.end()) {
            group_index.emplace(block.hash, groups.size());
            groups.push_back({&block});
        } else {
            groups[it->second].push_back(&block);
        }
    }

    std::vector<SimilarityMatch> matches;
    for (const auto& group : groups) {
        if (group.size() < 2) continue;
        for (size_t i = 0; i < group.size(); ++i) {
            for (size_t j = i + 1; j < group.size(); ++j) {
                auto match = make_match("exact-", *group[i], *group[j], 1.0, MatchType::Exact, 1.0,
                                        {"Consider extracting to a shared function or module"});
                match.refactoring_opportunity = true;
                matches.push_back(std::move(match));
            }
        }
    }

    spdlog::info("Exact pass: {} matches across {} hash groups", matches.size(), groups.size());
    return matches;
}

std::vector<SimilarityMatch> SimilarityEngine::find_structural_similarities(const std::vector<CodeBlock>& blocks) const {
    const int n = static_cast<int>(blocks.size());
    std::vector<std::vector<SimilarityMatch>> per_block(blocks.size());

    // Rows are independent; merging them in row order keeps the result deterministic
    #pragma omp parallel for schedule(dynamic)
    for (int i = 0; i < n; ++i) {
        const auto& block1 = blocks[i];
        for (int j = i + 1; j < n; ++j) {
            const auto& block2 = blocks[j];
            if (block1.file_path == block2.file_path) continue;

            double similarity = BlockHasher::jaccard_similarity(block1.tokens, block2.tokens);
            if (similarity < config_.structural_threshold) continue;

            per_block[i].push_back(make_match("structural-", block1, block2, similarity,
                                              MatchType::Structural, similarity * 0.9,
                                              {"Similar code structure detected",
                                               "Consider refactoring common patterns"}));
        }
    }

    std::vector<SimilarityMatch> matches;
    for (auto& row : per_block) {
        for (auto& m : row) matches.push_back(std::move(m));
    }

    spdlog::info("Structural pass: {} matches from {} blocks", matches.size(), blocks.size());
    return matches;
}

std::optional<SimilarityMatch> SimilarityEngine::judge_pair(const CodeBlock& block1, const CodeBlock& block2) {
    try {
        std::string prompt = JudgmentProtocol::build_similarity_prompt(block1, block2);
        std::string answer = generator_->generate_text(prompt, "semantic_judgment");
        auto judgment = JudgmentProtocol::parse_judgment(answer);

        if (judgment.similarity < config_.semantic_threshold) return std::nullopt;

        MatchType type = judgment.type == "functional" ? MatchType::Functional : MatchType::Semantic;
        return make_match("semantic-", block1, block2, judgment.similarity, type,
                          judgment.confidence, judgment.suggestions);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Semantic judgment failed for {}:{} vs {}:{}: {}",
                     block1.file_path, block1.start_line, block2.file_path, block2.start_line, e.what());
        return std::nullopt;
    } catch (...) {
        spdlog::warn("⚠️ Semantic judgment failed for {}:{} vs {}:{}: non-standard exception",
                     block1.file_path, block1.start_line, block2.file_path, block2.start_line);
        return std::nullopt;
    }
}

std::vector<SimilarityMatch> SimilarityEngine::find_semantic_similarities(const std::vector<CodeBlock>& blocks) {
    std::vector<SimilarityMatch> matches;
    if (!generator_ || !config_.enable_semantic) {
        spdlog::info("Semantic pass skipped (generator {}, enabled {})",
                     generator_ ? "ready" : "absent", config_.enable_semantic);
        return matches;
    }

    std::unordered_map<std::int32_t, int> hash_counts;
    for (const auto& block : blocks) hash_counts[block.hash]++;

    std::vector<const CodeBlock*> candidates;
    for (const auto& block : blocks) {
        if (hash_counts[block.hash] < 2) candidates.push_back(&block);
    }

    std::vector<std::pair<const CodeBlock*, const CodeBlock*>> pairs;
    const size_t batch_size = config_.semantic_batch_size;
    for (size_t start = 0; start < candidates.size(); start += batch_size) {
        size_t end = std::min(start + batch_size, candidates.size());
        for (size_t i = start; i < end; ++i) {
            for (size_t j = i + 1; j < end; ++j) {
                if (candidates[i]->file_path == candidates[j]->file_path) continue;
                pairs.emplace_back(candidates[i], candidates[j]);
            }
        }
    }

    spdlog::info("Semantic pass: {} candidate blocks, {} pairs to judge", candidates.size(), pairs.size());
    auto start_time = std::chrono::high_resolution_clock::now();

    // Fixed window of in-flight model calls; the next window starts once the current one drains
    const size_t window = config_.max_concurrent_judgments;
    for (size_t offset = 0; offset < pairs.size(); offset += window) {
        size_t end = std::min(offset + window, pairs.size());

        std::vector<std::future<std::optional<SimilarityMatch>>> in_flight;
        in_flight.reserve(end - offset);
        for (size_t k = offset; k < end; ++k) {
            const auto* a = pairs[k].first;
            const auto* b = pairs[k].second;
            in_flight.push_back(std::async(std::launch::async, [this, a, b]() {
                return judge_pair(*a, *b);
            }));
        }

        for (auto& f : in_flight) {
            auto result = f.get();
            if (result) matches.push_back(std::move(*result));
        }
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start_time).count();
    spdlog::info("⏱️ Semantic pass: {} matches in {:.2f} ms", matches.size(), duration);
    return matches;
}

std::vector<SimilarityMatch> SimilarityEngine::compare_blocks(
    const std::vector<CodeBlock>& blocks1,
    const std::vector<CodeBlock>& blocks2) const
{
    std::vector<SimilarityMatch> matches;

    for (const auto& block1 : blocks1) {
        for (const auto& block2 : blocks2) {
            if (block1.hash == block2.hash) {
                matches.push_back(make_match("", block1, block2, 1.0, MatchType::Exact, 1.0,
                                             {"Exact duplicate found"}));
                continue;
            }

            double score = BlockHasher::jaccard_similarity(block1.tokens, block2.tokens);
            if (score < config_.compare_threshold) continue;

            std::string suggestion = score > 0.8 ? "High structural similarity" : "Moderate similarity";
            matches.push_back(make_match("", block1, block2, score, MatchType::Structural,
                                         score * 0.8, {suggestion}));
        }
    }

    std::stable_sort(matches.begin(), matches.end(), [](const auto& a, const auto& b) {
        return a.similarity_score > b.similarity_score;
    });
    return matches;
}

} // namespace code_similarity
