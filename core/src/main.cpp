// Littera desktop host
// Config-based runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "littera-desktop.yaml";  // Default
    bool explicit_config = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            explicit_config = true;
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
            explicit_config = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: littera-desktop [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: littera-desktop.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    LOG_INFO("Littera desktop host starting...");

    littera::runtime::RuntimeConfig config;
    std::string error;

    if (std::filesystem::exists(config_path)) {
        LOG_INFO("Loading config: " + config_path);
        if (!littera::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " + error);
            return 1;
        }
    } else if (explicit_config) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    } else {
        LOG_INFO("No " << config_path << " found, using built-in defaults");
    }

    // Initialize logger level
    littera::logging::Logger::set_level(littera::logging::string_to_level(config.logging.level));

    // Install before initialize() so an early Ctrl+C still reaches the main loop
    littera::runtime::SignalHandler::install();

    littera::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    LOG_INFO("Runtime Ready");

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
