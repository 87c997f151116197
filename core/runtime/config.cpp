#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "../logging/logger.hpp"

namespace littera {
namespace runtime {

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 0 || config.http.port > 65535) {
            error = "HTTP port must be between 0 and 65535 (0 picks a free port)";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    // Validate sidecar settings
    const auto &launcher = config.sidecar.launcher;
    if (launcher.module.empty()) {
        error = "sidecar.module must not be empty";
        return false;
    }
    if (launcher.fallback_interpreter.empty()) {
        error = "sidecar.fallback_interpreter must not be empty";
        return false;
    }
    if (launcher.max_root_levels < 1) {
        error = "sidecar.max_root_levels must be >= 1";
        return false;
    }
    if (config.sidecar.ready_timeout_ms < 0) {
        error = "sidecar.ready_timeout_ms must be >= 0 (0 disables the timeout)";
        return false;
    }
    if (config.sidecar.shutdown_timeout_ms < 0) {
        error = "sidecar.shutdown_timeout_ms must be >= 0 (0 disables the timeout)";
        return false;
    }

    // Validate desktop settings
    if (config.desktop.work_marker.empty()) {
        error = "desktop.work_marker must not be empty";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "sidecar", "desktop", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["enabled"]) {
                config.http.enabled = http["enabled"].as<bool>();
            }
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load sidecar config
        if (yaml["sidecar"]) {
            const auto &sc = yaml["sidecar"];
            auto &launcher = config.sidecar.launcher;
            if (sc["module"]) {
                launcher.module = sc["module"].as<std::string>();
            }
            if (sc["project_marker"]) {
                launcher.project_marker = sc["project_marker"].as<std::string>();
            }
            if (sc["venv_python"]) {
                launcher.venv_python = sc["venv_python"].as<std::string>();
            }
            if (sc["virtual_env_var"]) {
                launcher.virtual_env_var = sc["virtual_env_var"].as<std::string>();
            }
            if (sc["fallback_interpreter"]) {
                launcher.fallback_interpreter = sc["fallback_interpreter"].as<std::string>();
            }
            if (sc["max_root_levels"]) {
                launcher.max_root_levels = sc["max_root_levels"].as<int>();
            }
            if (sc["ready_timeout_ms"]) {
                config.sidecar.ready_timeout_ms = sc["ready_timeout_ms"].as<int>();
            }
            if (sc["shutdown_timeout_ms"]) {
                config.sidecar.shutdown_timeout_ms = sc["shutdown_timeout_ms"].as<int>();
            }
        }

        // Load desktop config
        if (yaml["desktop"]) {
            if (yaml["desktop"]["config_path"]) {
                config.desktop.config_path = yaml["desktop"]["config_path"].as<std::string>();
            }
            if (yaml["desktop"]["work_marker"]) {
                config.desktop.work_marker = yaml["desktop"]["work_marker"].as<std::string>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Sidecar module: " << config.sidecar.launcher.module << " (ready timeout: "
                                             << config.sidecar.ready_timeout_ms << "ms, shutdown timeout: "
                                             << config.sidecar.shutdown_timeout_ms << "ms)");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace littera
