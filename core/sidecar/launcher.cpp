#include "launcher.hpp"

#include <cstdlib>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"

namespace littera {
namespace sidecar {

namespace fs = std::filesystem;

namespace {

// Existence check that never throws (permission errors count as "absent")
bool path_exists(const fs::path &path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

fs::path current_dir_or_dot() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return fs::path(".");
    }
    return cwd;
}

}  // namespace

fs::path find_project_root(const fs::path &start, const std::string &marker, int max_levels) {
    fs::path dir = start;
    for (int i = 0; i < max_levels; ++i) {
        if (path_exists(dir / marker)) {
            return dir;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            break;
        }
        dir = dir.parent_path();
    }

    // Assume we were started from a subdirectory of the project
    if (start.has_parent_path()) {
        return start.parent_path();
    }
    return start;
}

std::string resolve_interpreter(const LauncherConfig &config, const fs::path &start_dir) {
    fs::path root = find_project_root(start_dir, config.project_marker, config.max_root_levels);

    fs::path venv = root / config.venv_python;
    if (path_exists(venv)) {
        return venv.string();
    }

    if (!config.virtual_env_var.empty()) {
        const char *venv_dir = std::getenv(config.virtual_env_var.c_str());
        if (venv_dir != nullptr && *venv_dir != '\0') {
            fs::path venv_python = fs::path(venv_dir) / "bin" / "python";
            if (path_exists(venv_python)) {
                return venv_python.string();
            }
        }
    }

    return config.fallback_interpreter;
}

std::string resolve_interpreter(const LauncherConfig &config) {
    return resolve_interpreter(config, current_dir_or_dot());
}

Launcher::Launcher(LauncherConfig config) : config_(std::move(config)) {}

LaunchSpec Launcher::describe_launch(const std::string &work_dir) const {
    LaunchSpec spec;
    spec.executable = resolve_interpreter(config_);
    spec.args = {"-m", config_.module, "--work-dir", work_dir};
    LOG_DEBUG("[Launcher] " << spec.executable << " -m " << config_.module << " --work-dir " << work_dir);
    return spec;
}

LaunchSpec Launcher::describe_init(const std::string &path) const {
    LaunchSpec spec;
    spec.executable = resolve_interpreter(config_);
    spec.args = {"-m", "littera", "init", path};
    return spec;
}

}  // namespace sidecar
}  // namespace littera
