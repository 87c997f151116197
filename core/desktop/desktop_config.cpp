#include "desktop_config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

namespace littera {
namespace desktop {

namespace fs = std::filesystem;

void to_json(nlohmann::json &j, const RecentWork &work) {
    j = nlohmann::json{{"path", work.path}, {"name", work.name}, {"last_opened", work.last_opened}};
}

void from_json(const nlohmann::json &j, RecentWork &work) {
    j.at("path").get_to(work.path);
    j.at("name").get_to(work.name);
    j.at("last_opened").get_to(work.last_opened);
}

void to_json(nlohmann::json &j, const DesktopConfig &config) {
    j = nlohmann::json{{"recent", config.recent}};
    if (config.workspace) {
        j["workspace"] = *config.workspace;
    } else {
        j["workspace"] = nullptr;
    }
}

void from_json(const nlohmann::json &j, DesktopConfig &config) {
    config.recent.clear();
    if (j.contains("recent")) {
        j.at("recent").get_to(config.recent);
    }

    config.workspace.reset();
    if (j.contains("workspace") && !j.at("workspace").is_null()) {
        config.workspace = j.at("workspace").get<std::string>();
    }
}

fs::path default_desktop_config_path() {
    const char *home = std::getenv("HOME");
    fs::path base = (home != nullptr && *home != '\0') ? fs::path(home) : fs::path(".");
    return base / ".littera" / "desktop.json";
}

uint64_t now_epoch_seconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    return secs > 0 ? static_cast<uint64_t>(secs) : 0;
}

void record_recent(DesktopConfig &config, const std::string &path, uint64_t now) {
    std::string name = fs::path(path).filename().string();
    if (name.empty()) {
        // Trailing separator: "/works/novel/"
        name = fs::path(path).parent_path().filename().string();
    }
    if (name.empty()) {
        name = path;
    }

    config.recent.erase(std::remove_if(config.recent.begin(), config.recent.end(),
                                       [&path](const RecentWork &r) { return r.path == path; }),
                        config.recent.end());

    config.recent.insert(config.recent.begin(), RecentWork{path, name, now});

    if (config.recent.size() > kMaxRecentWorks) {
        config.recent.resize(kMaxRecentWorks);
    }
}

DesktopConfigStore::DesktopConfigStore(fs::path path) : path_(std::move(path)) {}

DesktopConfig DesktopConfigStore::load() const {
    std::ifstream file(path_);
    if (!file) {
        return DesktopConfig{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return nlohmann::json::parse(buffer.str()).get<DesktopConfig>();
    } catch (const nlohmann::json::exception &e) {
        LOG_WARN("[Desktop] Ignoring unreadable " << path_.string() << ": " << e.what());
        return DesktopConfig{};
    }
}

bool DesktopConfigStore::save(const DesktopConfig &config, std::string &error) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            error = "Failed to create " + path_.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file) {
        error = "Failed to open " + path_.string() + " for writing";
        return false;
    }

    nlohmann::json j = config;
    file << j.dump(2);
    file.close();
    if (!file) {
        error = "Failed to write " + path_.string();
        return false;
    }
    return true;
}

}  // namespace desktop
}  // namespace littera
