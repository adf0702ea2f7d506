#include "similarity_config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_similarity {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

double clamp_unit(double value) {
    return std::min(1.0, std::max(0.0, value));
}

size_t at_least_one(long long value) {
    return value < 1 ? 1 : static_cast<size_t>(value);
}

std::string normalize_extension(std::string ext) {
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

} // namespace

SimilarityConfig SimilarityConfig::from_json(const json& j) {
    SimilarityConfig cfg;
    if (!j.is_object()) return cfg;

    cfg.structural_threshold = clamp_unit(j.value("structural_threshold", cfg.structural_threshold));
    cfg.semantic_threshold = clamp_unit(j.value("semantic_threshold", cfg.semantic_threshold));
    cfg.refactoring_threshold = clamp_unit(j.value("refactoring_threshold", cfg.refactoring_threshold));
    cfg.compare_threshold = clamp_unit(j.value("compare_threshold", cfg.compare_threshold));
    cfg.semantic_batch_size = at_least_one(j.value("semantic_batch_size", static_cast<long long>(cfg.semantic_batch_size)));
    cfg.max_concurrent_judgments = at_least_one(j.value("max_concurrent_judgments", static_cast<long long>(cfg.max_concurrent_judgments)));
    cfg.enable_semantic = j.value("enable_semantic", cfg.enable_semantic);
    cfg.enable_pattern_extraction = j.value("enable_pattern_extraction", cfg.enable_pattern_extraction);
    cfg.savings_reduction_ratio = clamp_unit(j.value("savings_reduction_ratio", cfg.savings_reduction_ratio));
    cfg.maintainability_per_match = std::max(0, j.value("maintainability_per_match", cfg.maintainability_per_match));
    return cfg;
}

ProjectFilter ProjectFilter::defaults() {
    ProjectFilter filter;
    filter.allowed_extensions = {
        "txt", "md", "js", "ts", "jsx", "tsx", "html", "css", "scss", "sass", "less",
        "json", "xml", "yaml", "yml", "toml", "ini", "conf", "config", "env",
        "py", "rb", "php", "java", "c", "cpp", "h", "hpp", "cs", "go", "rs",
        "sh", "bash", "zsh", "fish", "ps1", "bat", "cmd", "dockerfile", "makefile",
        "sql", "graphql", "vue", "svelte", "astro", "prisma", "proto"
    };
    filter.ignored_paths = {".git", "node_modules", ".code_similarity"};
    return filter;
}

ProjectFilter ProjectFilter::from_json(const json& j) {
    ProjectFilter filter = defaults();
    if (!j.is_object()) return filter;

    if (j.contains("allowed_extensions")) {
        filter.allowed_extensions.clear();
        for (const auto& ext : j["allowed_extensions"].get<std::vector<std::string>>()) {
            filter.allowed_extensions.push_back(normalize_extension(ext));
        }
    }
    if (j.contains("ignored_paths")) {
        filter.ignored_paths = j["ignored_paths"].get<std::vector<std::string>>();
    }
    filter.included_paths = j.value("included_paths", std::vector<std::string>{});
    filter.max_file_bytes = j.value("max_file_bytes", filter.max_file_bytes);
    return filter;
}

ProjectConfig ProjectConfig::load(const std::string& root_path) {
    ProjectConfig config;

    fs::path config_path = fs::path(root_path) / ".code_similarity" / "config.json";
    if (!fs::exists(config_path)) {
        config_path = fs::path(root_path) / "config.json";
    }
    if (!fs::exists(config_path)) return config;

    try {
        std::ifstream f(config_path);
        auto j = json::parse(f);
        config.filter = ProjectFilter::from_json(j);
        config.similarity = SimilarityConfig::from_json(j.value("similarity", json::object()));
        spdlog::info("⚙️  Config loaded from {}: {} extensions, {} ignores, {} exceptions",
                     config_path.string(), config.filter.allowed_extensions.size(),
                     config.filter.ignored_paths.size(), config.filter.included_paths.size());
    } catch (const std::exception& e) {
        spdlog::error("❌ Config corrupted at {}: {}", config_path.string(), e.what());
        config = ProjectConfig{};
    }
    return config;
}

} // namespace code_similarity
