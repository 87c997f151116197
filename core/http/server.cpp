#include "server.hpp"

#include <exception>
#include <vector>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace littera {
namespace http {

namespace {
// open_work blocks for the whole readiness handshake, so reads/writes get more room than a plain REST call
constexpr int kReadTimeoutSeconds = 5;
constexpr int kWriteTimeoutSeconds = 5;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
constexpr const char *kAllowedMethods = "GET, POST, PUT, OPTIONS";

// "*" alone allows everything; one "*" inside an entry matches any run of characters
bool origin_matches(const std::string &allowed, const std::string &origin) {
    if (allowed == "*") {
        return true;
    }

    size_t star = allowed.find('*');
    if (star == std::string::npos) {
        return allowed == origin;
    }

    size_t suffix_len = allowed.size() - star - 1;
    if (origin.size() < star + suffix_len) {
        return false;
    }
    return origin.compare(0, star, allowed, 0, star) == 0 &&
           origin.compare(origin.size() - suffix_len, suffix_len, allowed, star + 1, suffix_len) == 0;
}

// Value for Access-Control-Allow-Origin, or false when the origin is not allowed
bool match_origin(const std::vector<std::string> &origins, const std::string &origin, std::string &allow) {
    for (const auto &allowed : origins) {
        if (origin_matches(allowed, origin)) {
            allow = allowed == "*" ? "*" : origin;
            return true;
        }
    }
    return false;
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, commands::DesktopCommands &commands)
    : config_(config), commands_(commands), start_time_(std::chrono::steady_clock::now()) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kReadTimeoutSeconds, 0);
    server_->set_write_timeout(kWriteTimeoutSeconds, 0);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // CORS allowlist; the webview origin varies between dev server and bundled app
    server_->set_post_routing_handler([origins = config_.cors_allowed_origins](const httplib::Request &req,
                                                                               httplib::Response &res) {
        auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        std::string allow;
        if (!match_origin(origins, origin_it->second, allow)) {
            return;
        }
        res.set_header("Access-Control-Allow-Origin", allow);
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    setup_routes();

    // Unrouted requests get the same JSON envelope as command failures
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        nlohmann::json body;
        switch (res.status) {
            case kStatusNotFound:
                body = make_error_response(StatusCode::NOT_FOUND, "Route not found: " + req.method + " " + req.path);
                break;
            case kStatusBadRequest:
                body = make_error_response(StatusCode::INVALID_ARGUMENT, "Bad request");
                break;
            default:
                body = make_error_response(StatusCode::INTERNAL, "HTTP error " + std::to_string(res.status));
                break;
        }
        res.set_content(body.dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            msg = e.what();
        } catch (...) {
            msg = "Unknown exception";
        }
        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " threw: " << msg);

        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, msg).dump(), "application/json");
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind.c_str());
        if (port_ <= 0) {
            error = "Failed to bind to " + config_.bind + " (any port)";
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET /v0/sidecar/port - Port of the running worker
    server_->Get("/v0/sidecar/port",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_sidecar_port(req, res); });

    // POST /v0/work/open - Start the worker for a work directory
    server_->Post("/v0/work/open",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_open_work(req, res); });

    // POST /v0/work/close - Stop the worker
    server_->Post("/v0/work/close",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_close_work(req, res); });

    // POST /v0/work/init - Initialize a new work
    server_->Post("/v0/work/init",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_init_work(req, res); });

    // GET /v0/picker - Recent works and workspace contents
    server_->Get("/v0/picker",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_picker(req, res); });

    // PUT /v0/workspace - Set the workspace directory
    server_->Put("/v0/workspace",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_put_workspace(req, res); });

    // GET /v0/runtime/status - Host status
    server_->Get("/v0/runtime/status",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_runtime_status(req, res); });

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET  /v0/sidecar/port");
    LOG_INFO("[HTTP]   POST /v0/work/open");
    LOG_INFO("[HTTP]   POST /v0/work/close");
    LOG_INFO("[HTTP]   POST /v0/work/init");
    LOG_INFO("[HTTP]   GET  /v0/picker");
    LOG_INFO("[HTTP]   PUT  /v0/workspace");
    LOG_INFO("[HTTP]   GET  /v0/runtime/status");
}

}  // namespace http
}  // namespace littera
