#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace littera {
namespace desktop {

// Subdirectory that marks a directory as a Littera work
constexpr const char *kDefaultWorkMarker = ".littera";

struct WorkEntry {
    std::string name;
    std::string path;
};

void to_json(nlohmann::json &j, const WorkEntry &entry);

// True when `path/<marker>` is a directory
bool is_work_dir(const std::filesystem::path &path, const std::string &marker = kDefaultWorkMarker);

// Immediate child directories of `dir` that are works, sorted by name.
// A missing or unreadable directory yields an empty list.
std::vector<WorkEntry> scan_workspace(const std::filesystem::path &dir,
                                      const std::string &marker = kDefaultWorkMarker);

}  // namespace desktop
}  // namespace littera
