#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "code_block.hpp"
#include "similarity_config.hpp"
#include "ai/TextGenerator.hpp"

namespace code_similarity {

class SimilarityEngine {
public:
    // generator may be null; the semantic pass is then skipped.
    explicit SimilarityEngine(std::shared_ptr<ITextGenerator> generator, SimilarityConfig config = {});

    // One match per unordered pair of hash-equal blocks. Same-file pairs are allowed.
    std::vector<SimilarityMatch> find_exact_duplicates(const std::vector<CodeBlock>& blocks) const;

    // Token Jaccard over cross-file pairs, kept at or above the structural threshold.
    std::vector<SimilarityMatch> find_structural_similarities(const std::vector<CodeBlock>& blocks) const;

    // Model-judged pairs among blocks without an exact duplicate. Blocks are
    // grouped into batches of semantic_batch_size and only cross-file pairs
    // inside a batch are judged, at most max_concurrent_judgments at a time.
    std::vector<SimilarityMatch> find_semantic_similarities(const std::vector<CodeBlock>& blocks);

    // Direct pairwise comparison for two block sets: hash equality, else token Jaccard.
    // Sorted by score, descending.
    std::vector<SimilarityMatch> compare_blocks(const std::vector<CodeBlock>& blocks1,
                                                const std::vector<CodeBlock>& blocks2) const;

    const SimilarityConfig& config() const { return config_; }

private:
    std::shared_ptr<ITextGenerator> generator_;
    SimilarityConfig config_;

    std::optional<SimilarityMatch> judge_pair(const CodeBlock& block1, const CodeBlock& block2);

    SimilarityMatch make_match(const std::string& id_prefix,
                               const CodeBlock& block1,
                               const CodeBlock& block2,
                               double score,
                               MatchType type,
                               double confidence,
                               std::vector<std::string> suggestions) const;
};

} // namespace code_similarity
