#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace littera {
namespace sidecar {

// Interpreter/module settings for the worker (sidecar: in YAML)
struct LauncherConfig {
    std::string module = "littera.desktop.server";  // Passed as `-m <module>`
    std::string project_marker = "pyproject.toml";  // File that identifies the project root
    std::string venv_python = ".venv/bin/python";   // Relative to the project root
    std::string virtual_env_var = "VIRTUAL_ENV";    // Active venv root, fallback source
    std::string fallback_interpreter = "python3";   // Resolved through PATH at spawn time
    int max_root_levels = 5;                        // Upward search depth for project_marker
};

// Ready-to-start process description. Nothing has been spawned yet.
struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
};

// Walk upward from `start` (inclusive) at most `max_levels` directories looking for `marker`.
// Falls back to the parent of `start` when the marker is not found.
std::filesystem::path find_project_root(const std::filesystem::path &start, const std::string &marker,
                                        int max_levels);

// Pick the interpreter: project venv, then $<virtual_env_var>/bin/python, then the bare fallback name.
std::string resolve_interpreter(const LauncherConfig &config, const std::filesystem::path &start_dir);

// Same as above, starting from the current working directory
std::string resolve_interpreter(const LauncherConfig &config);

// Launcher builds the worker invocation for a work directory.
// Only existence checks touch the filesystem; spawning is the supervisor's job.
class Launcher {
public:
    explicit Launcher(LauncherConfig config = {});

    // <interpreter> -m <module> --work-dir <work_dir>
    LaunchSpec describe_launch(const std::string &work_dir) const;

    // <interpreter> -m littera init <path>
    LaunchSpec describe_init(const std::string &path) const;

    const LauncherConfig &config() const { return config_; }

private:
    LauncherConfig config_;
};

}  // namespace sidecar
}  // namespace littera
