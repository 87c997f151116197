#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace littera {
namespace desktop {

constexpr size_t kMaxRecentWorks = 10;

struct RecentWork {
    std::string path;
    std::string name;          // Last path component
    uint64_t last_opened = 0;  // Unix seconds
};

// Contents of ~/.littera/desktop.json
struct DesktopConfig {
    std::vector<RecentWork> recent;  // Most recent first, unique paths, at most kMaxRecentWorks
    std::optional<std::string> workspace;
};

void to_json(nlohmann::json &j, const RecentWork &work);
void from_json(const nlohmann::json &j, RecentWork &work);
void to_json(nlohmann::json &j, const DesktopConfig &config);
void from_json(const nlohmann::json &j, DesktopConfig &config);

// $HOME/.littera/desktop.json ("./.littera/desktop.json" without HOME)
std::filesystem::path default_desktop_config_path();

uint64_t now_epoch_seconds();

// Move `path` to the front of the recent list (dedup by path, cap at kMaxRecentWorks)
void record_recent(DesktopConfig &config, const std::string &path, uint64_t now);

// Load/save of the per-user desktop state file
class DesktopConfigStore {
public:
    explicit DesktopConfigStore(std::filesystem::path path);

    // A missing or unreadable file yields an empty config
    DesktopConfig load() const;

    // Creates the parent directory as needed
    bool save(const DesktopConfig &config, std::string &error) const;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace desktop
}  // namespace littera
