#include "io/ProjectFileSource.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace code_similarity {

// Segment-wise containment; a child equal to the parent counts as inside.
bool is_inside(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;

    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();

    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        // A trailing slash leaves an empty or "." segment behind
        if (it_p->string() == "." || it_p->string().empty()) continue;
        if (it_c == c.end()) return false;
        if (it_c->string() != it_p->string()) return false;
        ++it_c;
    }
    return true;
}

namespace {

std::string file_type_key(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
    // Extension-less names such as Dockerfile or Makefile match on the name itself
    if (ext.empty()) ext = path.filename().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

} // namespace

LocalProjectFileSource::LocalProjectFileSource(ProjectFilter filter)
    : has_fixed_filter_(true), filter_(std::move(filter)) {}

void LocalProjectFileSource::scan_directory_recursive(
    const fs::path& current_dir,
    const fs::path& root_dir,
    const ProjectFilter& filter,
    std::vector<fs::path>& results
) {
    std::unordered_set<std::string> ext_set(filter.allowed_extensions.begin(), filter.allowed_extensions.end());

    std::error_code ec;
    fs::directory_iterator it(current_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Scanner skipped {}: {}", current_dir.string(), ec.message());
        return;
    }

    try {
        for (const auto& entry : it) {
            const auto& path = entry.path();
            fs::path rel_fs = fs::relative(path, root_dir, ec);
            if (ec) continue;

            bool explicitly_ignored = false;
            for (const auto& ign : filter.ignored_paths) {
                if (is_inside(rel_fs, fs::path(ign))) {
                    explicitly_ignored = true;
                    break;
                }
            }

            bool is_explicit_exception = false;
            bool is_bridge_to_exception = false;
            for (const auto& inc : filter.included_paths) {
                fs::path inc_path(inc);
                if (is_inside(rel_fs, inc_path)) { is_explicit_exception = true; break; }
                if (is_inside(inc_path, rel_fs)) { is_bridge_to_exception = true; }
            }

            // Symlinked directories can point back at an ancestor; never follow them
            if (entry.is_symlink(ec) && entry.is_directory(ec)) {
                spdlog::debug("LINK | {} | SKIP (directory symlink)", rel_fs.generic_string());
                continue;
            }

            if (entry.is_directory(ec)) {
                bool enter = !explicitly_ignored || is_bridge_to_exception || is_explicit_exception;
                spdlog::debug("DIR  | {} | Ignored: {} | Action: {}", rel_fs.generic_string(),
                              explicitly_ignored ? "YES" : "NO ", enter ? "ENTER" : "SKIP");
                if (enter) scan_directory_recursive(path, root_dir, filter, results);
            } else if (entry.is_regular_file(ec)) {
                bool collect = !explicitly_ignored || is_explicit_exception;
                bool ext_match = ext_set.empty() || ext_set.count(file_type_key(path));
                auto size = entry.file_size(ec);
                bool fits = !ec && size <= filter.max_file_bytes;

                if (collect && ext_match && fits) {
                    results.push_back(path);
                } else {
                    spdlog::debug("FILE | {} | SKIP (Ignored: {}, ExtMatch: {}, Fits: {})", rel_fs.generic_string(),
                                  explicitly_ignored ? "YES" : "NO ", ext_match ? "YES" : "NO ", fits ? "YES" : "NO ");
                }
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Scanner error at {}: {}", current_dir.string(), e.what());
    }
}

std::vector<std::string> LocalProjectFileSource::list_project_text_files(const std::string& project_path) {
    if (project_path.empty()) {
        throw std::runtime_error("Project path is required for indexing.");
    }

    fs::path root = fs::absolute(fs::path(project_path)).lexically_normal();
    if (!fs::is_directory(root)) {
        throw std::runtime_error("Project path not found: " + project_path);
    }

    ProjectFilter filter = has_fixed_filter_ ? filter_ : ProjectConfig::load(root.string()).filter;

    {
        std::lock_guard<std::mutex> lock(limits_mutex_);
        root_limits_[root] = filter.max_file_bytes;
    }

    std::vector<fs::path> files;
    scan_directory_recursive(root, root, filter, files);
    std::sort(files.begin(), files.end());

    std::vector<std::string> result;
    result.reserve(files.size());
    for (const auto& f : files) result.push_back(f.string());

    spdlog::info("🔍 Scanned {}: {} text files", root.string(), result.size());
    return result;
}

size_t LocalProjectFileSource::size_limit_for(const fs::path& file) {
    fs::path absolute = fs::absolute(file).lexically_normal();

    // The deepest listed root that holds the file decides
    std::lock_guard<std::mutex> lock(limits_mutex_);
    size_t limit = filter_.max_file_bytes;
    size_t best_depth = 0;
    for (const auto& [root, root_limit] : root_limits_) {
        if (!is_inside(absolute, root)) continue;
        size_t depth = static_cast<size_t>(std::distance(root.begin(), root.end()));
        if (depth > best_depth) {
            best_depth = depth;
            limit = root_limit;
        }
    }
    return limit;
}

std::string LocalProjectFileSource::read_text_file(const std::string& file_path) {
    fs::path target = fs::path(file_path).lexically_normal();

    if (!fs::exists(target)) {
        throw std::runtime_error("File not found: " + file_path);
    }
    if (fs::is_directory(target)) {
        throw std::runtime_error("Path is a directory: " + file_path);
    }
    if (fs::file_size(target) > size_limit_for(target)) {
        throw std::runtime_error("File too large for analysis: " + file_path);
    }

    std::ifstream f(target, std::ios::in | std::ios::binary);
    if (!f) {
        throw std::runtime_error("File could not be opened: " + file_path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

} // namespace code_similarity
