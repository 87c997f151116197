#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace littera {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing Littera desktop host");

    if (!init_sidecar(error)) {
        return false;
    }

    if (!init_desktop(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_sidecar(std::string &) {
    launcher_ = std::make_unique<sidecar::Launcher>(config_.sidecar.launcher);

    sidecar::HandshakeOptions options;
    options.ready_timeout_ms = config_.sidecar.ready_timeout_ms;
    options.shutdown_timeout_ms = config_.sidecar.shutdown_timeout_ms;

    const sidecar::Launcher *launcher = launcher_.get();
    supervisor_ = std::make_unique<sidecar::SidecarSupervisor>(
        [launcher](const std::string &work_dir) { return launcher->describe_launch(work_dir); }, options);

    LOG_INFO("[Runtime] Sidecar supervisor created (module: " << config_.sidecar.launcher.module << ")");
    return true;
}

bool Runtime::init_desktop(std::string &) {
    std::filesystem::path store_path = config_.desktop.config_path.empty()
                                           ? desktop::default_desktop_config_path()
                                           : std::filesystem::path(config_.desktop.config_path);
    desktop_store_ = std::make_unique<desktop::DesktopConfigStore>(store_path);
    LOG_INFO("[Runtime] Desktop state file: " << store_path.string());

    const sidecar::Launcher *launcher = launcher_.get();
    commands_ = std::make_unique<commands::DesktopCommands>(
        *supervisor_, *desktop_store_, [launcher](const std::string &path) { return launcher->describe_init(path); },
        config_.desktop.work_marker);
    return true;
}

bool Runtime::init_http(std::string &error) {
    // Create and start HTTP server if enabled
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, *commands_);

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << http_server_->get_port());
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Check for shutdown signal
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Stop HTTP server first so no command races the final close
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }

    if (supervisor_) {
        LOG_INFO("[Runtime] Stopping sidecar");
        sidecar::SidecarError error;
        if (!supervisor_->close(error)) {
            LOG_ERROR("[Runtime] Sidecar shutdown failed: " << error.message);
        }
    }

    LOG_INFO("[Runtime] Shutdown complete");
}

}  // namespace runtime
}  // namespace littera
