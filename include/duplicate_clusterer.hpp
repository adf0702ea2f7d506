#pragma once
#include <memory>
#include <string>
#include <vector>
#include "code_block.hpp"
#include "similarity_config.hpp"
#include "ai/TextGenerator.hpp"

namespace code_similarity {

// Greedy grouping of pairwise matches. Each unprocessed match seeds a cluster
// that absorbs every remaining match touching one of the seed's two files.
// Files pulled in that way do not expand the cluster further, so chains
// through three or more files can end up split across clusters.
class DuplicateClusterer {
public:
    explicit DuplicateClusterer(std::shared_ptr<ITextGenerator> generator, SimilarityConfig config = {});

    // Sorted by average similarity, descending.
    std::vector<DuplicateCluster> cluster(const std::vector<SimilarityMatch>& matches);

    static RefactoringPriority calculate_priority(double score);

    EstimatedSavings calculate_savings(const SimilarityMatch& seed, size_t absorbed_count) const;

    // Model-written description; "Similar code structure" whenever that is unavailable.
    std::string extract_common_pattern(const std::vector<std::string>& codes);

private:
    std::shared_ptr<ITextGenerator> generator_;
    SimilarityConfig config_;
};

} // namespace code_similarity
