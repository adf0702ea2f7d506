#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "similarity_config.hpp"

namespace code_similarity {

namespace fs = std::filesystem;

// Project file access. Both calls throw on I/O failure.
class IProjectFileSource {
public:
    virtual ~IProjectFileSource() = default;
    virtual std::vector<std::string> list_project_text_files(const std::string& project_path) = 0;
    virtual std::string read_text_file(const std::string& file_path) = 0;
};

bool is_inside(const fs::path& child, const fs::path& parent);

class LocalProjectFileSource : public IProjectFileSource {
public:
    // Without a fixed filter the project's own config file decides per listing.
    LocalProjectFileSource() = default;
    explicit LocalProjectFileSource(ProjectFilter filter);

    std::vector<std::string> list_project_text_files(const std::string& project_path) override;
    std::string read_text_file(const std::string& file_path) override;

private:
    bool has_fixed_filter_ = false;
    ProjectFilter filter_ = ProjectFilter::defaults();

    // Size limit of every root listed so far, so reads honor the project's own config
    std::mutex limits_mutex_;
    std::map<fs::path, size_t> root_limits_;

    size_t size_limit_for(const fs::path& file);

    void scan_directory_recursive(const fs::path& current_dir,
                                  const fs::path& root_dir,
                                  const ProjectFilter& filter,
                                  std::vector<fs::path>& results);
};

} // namespace code_similarity
