#pragma once
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "code_block.hpp"
#include "similarity_config.hpp"
#include "ai/TextGenerator.hpp"
#include "io/ProjectFileSource.hpp"

namespace code_similarity {

class AnalysisInProgressError : public std::runtime_error {
public:
    AnalysisInProgressError() : std::runtime_error("Analysis already in progress") {}
};

class SimilarityAnalyzer {
public:
    using ProgressCallback = std::function<void(int)>;

    SimilarityAnalyzer(std::shared_ptr<IProjectFileSource> file_source,
                       std::shared_ptr<ITextGenerator> generator,
                       SimilarityConfig config = {});

    // Runs extract -> exact -> structural -> semantic -> cluster and caches the
    // report under project_path. Only one run at a time: a concurrent call
    // throws AnalysisInProgressError. Every other failure is absorbed per item.
    SimilarityReport analyze_project(const std::string& project_path);

    // Block-level comparison of two files without the semantic or clustering
    // stages. Safe to call while an analysis is running.
    std::vector<SimilarityMatch> compare_files(const std::string& file1, const std::string& file2);

    // Returns the unsubscribe action. It stays valid after the analyzer is gone.
    std::function<void()> on_progress(ProgressCallback callback);

    std::optional<SimilarityReport> get_last_report(const std::string& project_path) const;
    void clear_cache();

    bool is_analyzing() const { return is_analyzing_.load(); }
    int analysis_progress() const { return analysis_progress_.load(); }

private:
    struct ProgressRegistry {
        std::mutex mutex;
        std::map<size_t, ProgressCallback> callbacks;
        size_t next_id = 0;
    };

    std::shared_ptr<IProjectFileSource> file_source_;
    std::shared_ptr<ITextGenerator> generator_;
    SimilarityConfig config_;

    std::atomic<bool> is_analyzing_{false};
    std::atomic<int> analysis_progress_{0};
    std::shared_ptr<ProgressRegistry> progress_registry_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, SimilarityReport> analysis_cache_;

    std::vector<std::string> get_project_files(const std::string& project_path);
    std::vector<CodeBlock> extract_file_blocks(const std::string& file_path);
    void set_progress(int progress);
    static void calculate_statistics(SimilarityReport& report);
};

} // namespace code_similarity
