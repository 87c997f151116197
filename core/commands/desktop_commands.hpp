#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "desktop/desktop_config.hpp"
#include "desktop/workspace.hpp"
#include "sidecar/i_sidecar_supervisor.hpp"
#include "sidecar/launcher.hpp"
#include "sidecar/sidecar_error.hpp"

namespace littera {
namespace commands {

// Picker screen contents: recents plus the works found in the workspace
struct PickerData {
    std::vector<desktop::RecentWork> recent;
    std::vector<desktop::WorkEntry> workspace_works;
    std::optional<std::string> workspace;
};

void to_json(nlohmann::json &j, const PickerData &data);

/**
 * @brief Operations the controlling application invokes
 *
 * Stateless apart from serializing access to the desktop config file;
 * all worker state lives in the supervisor.
 *
 * Thread Safety:
 * - Sidecar operations inherit the supervisor's locking
 * - Config read-modify-write sequences are serialized by config_mutex_
 */
class DesktopCommands {
public:
    using InitSpecFactory = std::function<sidecar::LaunchSpec(const std::string &path)>;

    DesktopCommands(sidecar::ISidecarSupervisor &supervisor, desktop::DesktopConfigStore &store,
                    InitSpecFactory init_factory, std::string work_marker = desktop::kDefaultWorkMarker);

    // Port of the running worker, "Sidecar not ready" otherwise
    bool sidecar_port(uint16_t &port, sidecar::SidecarError &error) const;

    // Validate the work, (re)start the worker for it and record it in recents.
    // An invalid work is rejected before the running worker is touched.
    bool open_work(const std::string &path, uint16_t &port, sidecar::SidecarError &error);

    // Stop the worker (no-op when none is running)
    bool close_work(sidecar::SidecarError &error);

    PickerData get_picker_data() const;

    // Persist the workspace directory and return refreshed picker data
    PickerData set_workspace(const std::string &path);

    // Run `littera init <path>` to completion
    bool init_work(const std::string &path, sidecar::SidecarError &error);

private:
    sidecar::ISidecarSupervisor &supervisor_;
    desktop::DesktopConfigStore &store_;
    InitSpecFactory init_factory_;
    std::string work_marker_;

    mutable std::mutex config_mutex_;

    PickerData build_picker_data(desktop::DesktopConfig config) const;
};

}  // namespace commands
}  // namespace littera
