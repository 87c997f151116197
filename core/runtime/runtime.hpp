#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "commands/desktop_commands.hpp"
#include "config.hpp"
#include "desktop/desktop_config.hpp"
#include "http/server.hpp"
#include "sidecar/launcher.hpp"
#include "sidecar/sidecar_supervisor.hpp"

namespace littera {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Initialize all components (launcher, supervisor, desktop state, HTTP)
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stop the command endpoint, then retire the worker
    void shutdown();

private:
    // Staged initialization helpers
    bool init_sidecar(std::string &error);
    bool init_desktop(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<sidecar::Launcher> launcher_;
    std::unique_ptr<sidecar::SidecarSupervisor> supervisor_;
    std::unique_ptr<desktop::DesktopConfigStore> desktop_store_;
    std::unique_ptr<commands::DesktopCommands> commands_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
    bool shut_down_ = false;
};

}  // namespace runtime
}  // namespace littera
