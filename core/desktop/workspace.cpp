#include "workspace.hpp"

#include <algorithm>
#include <system_error>

#include "logging/logger.hpp"

namespace littera {
namespace desktop {

namespace fs = std::filesystem;

void to_json(nlohmann::json &j, const WorkEntry &entry) { j = nlohmann::json{{"name", entry.name}, {"path", entry.path}}; }

bool is_work_dir(const fs::path &path, const std::string &marker) {
    std::error_code ec;
    return fs::is_directory(path / marker, ec);
}

std::vector<WorkEntry> scan_workspace(const fs::path &dir, const std::string &marker) {
    std::vector<WorkEntry> works;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        LOG_DEBUG("[Workspace] Cannot scan " << dir.string() << ": " << ec.message());
        return works;
    }

    fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const fs::path child = it->path();
        std::error_code type_ec;
        if (fs::is_directory(child, type_ec) && is_work_dir(child, marker)) {
            works.push_back(WorkEntry{child.filename().string(), child.string()});
        }
    }

    std::sort(works.begin(), works.end(), [](const WorkEntry &a, const WorkEntry &b) { return a.name < b.name; });
    return works;
}

}  // namespace desktop
}  // namespace littera
