#include "desktop_commands.hpp"

#include <utility>

#include "desktop/init_runner.hpp"
#include "logging/logger.hpp"

namespace littera {
namespace commands {

void to_json(nlohmann::json &j, const PickerData &data) {
    j = nlohmann::json{{"recent", data.recent}, {"workspace_works", data.workspace_works}};
    if (data.workspace) {
        j["workspace"] = *data.workspace;
    } else {
        j["workspace"] = nullptr;
    }
}

DesktopCommands::DesktopCommands(sidecar::ISidecarSupervisor &supervisor, desktop::DesktopConfigStore &store,
                                 InitSpecFactory init_factory, std::string work_marker)
    : supervisor_(supervisor),
      store_(store),
      init_factory_(std::move(init_factory)),
      work_marker_(std::move(work_marker)) {}

bool DesktopCommands::sidecar_port(uint16_t &port, sidecar::SidecarError &error) const {
    return supervisor_.port(port, error);
}

bool DesktopCommands::open_work(const std::string &path, uint16_t &port, sidecar::SidecarError &error) {
    if (path.empty() || !desktop::is_work_dir(path, work_marker_)) {
        error.set(sidecar::ErrorCode::INVALID_WORK_DIR,
                  "Not a Littera work (no " + work_marker_ + "/ directory): " + path);
        return false;
    }

    if (!supervisor_.open(path, port, error)) {
        return false;
    }
    LOG_INFO("[Desktop] Opened " << path << " (sidecar port " << port << ")");

    std::lock_guard<std::mutex> lock(config_mutex_);
    desktop::DesktopConfig config = store_.load();
    desktop::record_recent(config, path, desktop::now_epoch_seconds());

    std::string save_error;
    if (!store_.save(config, save_error)) {
        // The work is open; losing the recents entry is not worth failing the call
        LOG_WARN("[Desktop] Failed to record recent work: " << save_error);
    }

    return true;
}

bool DesktopCommands::close_work(sidecar::SidecarError &error) { return supervisor_.close(error); }

PickerData DesktopCommands::get_picker_data() const {
    desktop::DesktopConfig config;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config = store_.load();
    }
    return build_picker_data(std::move(config));
}

PickerData DesktopCommands::set_workspace(const std::string &path) {
    desktop::DesktopConfig config;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config = store_.load();
        config.workspace = path;

        std::string save_error;
        if (!store_.save(config, save_error)) {
            LOG_WARN("[Desktop] Failed to save workspace: " << save_error);
        }
    }
    return build_picker_data(std::move(config));
}

bool DesktopCommands::init_work(const std::string &path, sidecar::SidecarError &error) {
    if (path.empty()) {
        error.set(sidecar::ErrorCode::INIT_FAILED, "littera init failed: empty path");
        return false;
    }

    LOG_INFO("[Desktop] Initializing work at " << path);
    return desktop::run_init(init_factory_(path), error);
}

PickerData DesktopCommands::build_picker_data(desktop::DesktopConfig config) const {
    PickerData data;
    if (config.workspace) {
        data.workspace_works = desktop::scan_workspace(*config.workspace, work_marker_);
    }
    data.recent = std::move(config.recent);
    data.workspace = std::move(config.workspace);
    return data;
}

}  // namespace commands
}  // namespace littera
