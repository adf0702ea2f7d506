#include "similarity_analyzer.hpp"
#include "block_extractor.hpp"
#include "duplicate_clusterer.hpp"
#include "similarity_engine.hpp"
#include <chrono>
#include <utility>
#include <spdlog/spdlog.h>

namespace code_similarity {

namespace {

// Clears the in-flight flag on every exit path of a run
class AnalysisFlagGuard {
public:
    explicit AnalysisFlagGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~AnalysisFlagGuard() { flag_.store(false); }

    AnalysisFlagGuard(const AnalysisFlagGuard&) = delete;
    AnalysisFlagGuard& operator=(const AnalysisFlagGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

long long now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void append(std::vector<SimilarityMatch>& into, std::vector<SimilarityMatch>&& from) {
    into.insert(into.end(), std::make_move_iterator(from.begin()), std::make_move_iterator(from.end()));
}

} // namespace

SimilarityAnalyzer::SimilarityAnalyzer(
    std::shared_ptr<IProjectFileSource> file_source,
    std::shared_ptr<ITextGenerator> generator,
    SimilarityConfig config
) : file_source_(std::move(file_source)),
    generator_(std::move(generator)),
    config_(config),
    progress_registry_(std::make_shared<ProgressRegistry>()) {}

SimilarityReport SimilarityAnalyzer::analyze_project(const std::string& project_path) {
    bool expected = false;
    if (!is_analyzing_.compare_exchange_strong(expected, true)) {
        spdlog::warn("Rejected analysis of {}: another analysis is running", project_path);
        throw AnalysisInProgressError();
    }
    AnalysisFlagGuard guard(is_analyzing_);

    auto start = std::chrono::high_resolution_clock::now();
    spdlog::info("🚀 Similarity analysis started: {}", project_path);
    set_progress(0);

    auto files = get_project_files(project_path);

    SimilarityReport report;
    report.id = "similarity-" + std::to_string(now_ms());
    report.project_path = project_path;
    report.timestamp = now_ms();
    report.total_files = static_cast<int>(files.size());

    // Phase 1: blocks
    std::vector<CodeBlock> blocks;
    for (const auto& file : files) {
        auto file_blocks = extract_file_blocks(file);
        blocks.insert(blocks.end(), std::make_move_iterator(file_blocks.begin()),
                      std::make_move_iterator(file_blocks.end()));
    }
    spdlog::info("Extracted {} blocks from {} files", blocks.size(), files.size());
    set_progress(20);

    SimilarityEngine engine(generator_, config_);

    // Phase 2-4: exact, structural, semantic
    append(report.similarity_matches, engine.find_exact_duplicates(blocks));
    set_progress(40);

    append(report.similarity_matches, engine.find_structural_similarities(blocks));
    set_progress(60);

    append(report.similarity_matches, engine.find_semantic_similarities(blocks));
    set_progress(80);

    // Phase 5: clusters and totals
    DuplicateClusterer clusterer(generator_, config_);
    report.duplicate_clusters = clusterer.cluster(report.similarity_matches);
    report.total_matches = static_cast<int>(report.similarity_matches.size());
    calculate_statistics(report);

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        analysis_cache_[project_path] = report;
    }
    set_progress(100);

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("✅ Similarity analysis complete: {} files, {} matches, {} clusters in {:.2f} ms",
                 report.total_files, report.total_matches, report.duplicate_clusters.size(), duration);
    return report;
}

std::vector<SimilarityMatch> SimilarityAnalyzer::compare_files(const std::string& file1, const std::string& file2) {
    auto blocks1 = extract_file_blocks(file1);
    auto blocks2 = extract_file_blocks(file2);

    SimilarityEngine engine(nullptr, config_);
    return engine.compare_blocks(blocks1, blocks2);
}

std::vector<std::string> SimilarityAnalyzer::get_project_files(const std::string& project_path) {
    try {
        return file_source_->list_project_text_files(project_path);
    } catch (const std::exception& e) {
        spdlog::error("❌ Project listing failed for {}: {}", project_path, e.what());
        return {};
    } catch (...) {
        spdlog::error("❌ Project listing failed for {}: non-standard exception", project_path);
        return {};
    }
}

std::vector<CodeBlock> SimilarityAnalyzer::extract_file_blocks(const std::string& file_path) {
    try {
        std::string content = file_source_->read_text_file(file_path);
        return BlockExtractor::extract_file_blocks(file_path, content);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Failed to extract blocks from {}: {}", file_path, e.what());
        return {};
    } catch (...) {
        spdlog::warn("⚠️ Failed to extract blocks from {}: non-standard exception", file_path);
        return {};
    }
}

std::function<void()> SimilarityAnalyzer::on_progress(ProgressCallback callback) {
    size_t id;
    {
        std::lock_guard<std::mutex> lock(progress_registry_->mutex);
        id = progress_registry_->next_id++;
        progress_registry_->callbacks.emplace(id, std::move(callback));
    }

    std::weak_ptr<ProgressRegistry> weak = progress_registry_;
    return [weak, id]() {
        if (auto registry = weak.lock()) {
            std::lock_guard<std::mutex> lock(registry->mutex);
            registry->callbacks.erase(id);
        }
    };
}

void SimilarityAnalyzer::set_progress(int progress) {
    analysis_progress_.store(progress);

    // Snapshot so observers may unsubscribe from inside their callback
    std::vector<ProgressCallback> snapshot;
    {
        std::lock_guard<std::mutex> lock(progress_registry_->mutex);
        for (const auto& [id, cb] : progress_registry_->callbacks) snapshot.push_back(cb);
    }

    for (const auto& cb : snapshot) {
        try {
            cb(progress);
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Progress callback failed at {}%: {}", progress, e.what());
        } catch (...) {
            spdlog::warn("⚠️ Progress callback failed at {}% with a non-standard exception", progress);
        }
    }
}

std::optional<SimilarityReport> SimilarityAnalyzer::get_last_report(const std::string& project_path) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = analysis_cache_.find(project_path);
    if (it == analysis_cache_.end()) return std::nullopt;
    return it->second;
}

void SimilarityAnalyzer::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    analysis_cache_.clear();
}

void SimilarityAnalyzer::calculate_statistics(SimilarityReport& report) {
    auto& stats = report.statistics;
    stats = SimilarityStatistics{};

    for (const auto& m : report.similarity_matches) {
        switch (m.match_type) {
            case MatchType::Exact: stats.exact_duplicates++; break;
            case MatchType::Structural: stats.structural_similar++; break;
            case MatchType::Semantic: stats.semantic_similar++; break;
            case MatchType::Functional: stats.functional_similar++; break;
        }
    }
    for (const auto& c : report.duplicate_clusters) {
        stats.potential_savings += c.estimated_savings.lines_of_code;
    }
}

} // namespace code_similarity
