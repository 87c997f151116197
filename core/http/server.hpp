#pragma once

#include <atomic>
#include <chrono>
#include <httplib.h>
#include <memory>
#include <string>
#include <thread>

#include "commands/desktop_commands.hpp"
#include "runtime/config.hpp"

namespace littera {
namespace http {

/**
 * @brief HTTP command endpoint for the controlling application
 *
 * Exposes the desktop command surface as JSON routes on a loopback port.
 * It runs in a separate thread and delegates every operation to
 * DesktopCommands; it holds no worker state of its own.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - Concurrent open/close requests serialize on the supervisor lock
 *
 * Lifecycle:
 * - start() binds to the configured port (0 = any free port) and spawns the server thread
 * - stop() signals shutdown and joins the server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, commands::DesktopCommands &commands);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Port the server is listening on (resolved when configured as 0)
     */
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    commands::DesktopCommands &commands_;
    std::chrono::steady_clock::time_point start_time_;

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Route handlers (implemented in handlers/command_handlers.cpp)
    void handle_get_sidecar_port(const httplib::Request &req, httplib::Response &res);
    void handle_post_open_work(const httplib::Request &req, httplib::Response &res);
    void handle_post_close_work(const httplib::Request &req, httplib::Response &res);
    void handle_post_init_work(const httplib::Request &req, httplib::Response &res);
    void handle_get_picker(const httplib::Request &req, httplib::Response &res);
    void handle_put_workspace(const httplib::Request &req, httplib::Response &res);
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace littera
