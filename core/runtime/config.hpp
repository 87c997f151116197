#pragma once

#include <string>
#include <vector>

#include "../sidecar/launcher.hpp"

namespace littera {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Command endpoint for the controlling application (http: in YAML)
struct HttpConfig {
    bool enabled = true;                                 // HTTP command endpoint enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 7341;                                     // Command endpoint port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    int thread_pool_size = 8;                            // Worker thread pool size
};

// Worker supervision (sidecar: in YAML)
struct SidecarConfig {
    sidecar::LauncherConfig launcher;  // Interpreter resolution + module
    int ready_timeout_ms = 0;          // Readiness handshake bound (0 = wait indefinitely)
    int shutdown_timeout_ms = 0;       // Exit wait after stdin EOF before SIGKILL (0 = wait indefinitely)
};

// Per-user desktop state (desktop: in YAML)
struct DesktopSection {
    std::string config_path;               // Empty: $HOME/.littera/desktop.json
    std::string work_marker = ".littera";  // Subdirectory that identifies a work
};

struct RuntimeConfig {
    HttpConfig http;
    SidecarConfig sidecar;
    DesktopSection desktop;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace littera
