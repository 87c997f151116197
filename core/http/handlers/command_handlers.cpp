#include <chrono>

#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace littera {
namespace http {

//=============================================================================
// GET /v0/sidecar/port
//=============================================================================
void HttpServer::handle_get_sidecar_port(const httplib::Request &, httplib::Response &res) {
    uint16_t port = 0;
    sidecar::SidecarError error;
    if (!commands_.sidecar_port(port, error)) {
        send_error(res, error);
        return;
    }

    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}, {"port", port}});
}

//=============================================================================
// POST /v0/work/open
//=============================================================================
void HttpServer::handle_post_open_work(const httplib::Request &req, httplib::Response &res) {
    std::string path;
    if (!parse_path_body(req, res, path)) {
        return;
    }

    uint16_t port = 0;
    sidecar::SidecarError error;
    if (!commands_.open_work(path, port, error)) {
        LOG_WARN("[HTTP] open_work failed for " << path << ": " << error.message);
        send_error(res, error);
        return;
    }

    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}, {"port", port}, {"path", path}});
}

//=============================================================================
// POST /v0/work/close
//=============================================================================
void HttpServer::handle_post_close_work(const httplib::Request &, httplib::Response &res) {
    sidecar::SidecarError error;
    if (!commands_.close_work(error)) {
        send_error(res, error);
        return;
    }

    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}});
}

//=============================================================================
// POST /v0/work/init
//=============================================================================
void HttpServer::handle_post_init_work(const httplib::Request &req, httplib::Response &res) {
    std::string path;
    if (!parse_path_body(req, res, path)) {
        return;
    }

    sidecar::SidecarError error;
    if (!commands_.init_work(path, error)) {
        send_error(res, error);
        return;
    }

    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}, {"path", path}});
}

//=============================================================================
// GET /v0/picker
//=============================================================================
void HttpServer::handle_get_picker(const httplib::Request &, httplib::Response &res) {
    nlohmann::json response = commands_.get_picker_data();
    response["status"] = make_status(StatusCode::OK);
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// PUT /v0/workspace
//=============================================================================
void HttpServer::handle_put_workspace(const httplib::Request &req, httplib::Response &res) {
    std::string path;
    if (!parse_path_body(req, res, path)) {
        return;
    }

    nlohmann::json response = commands_.set_workspace(path);
    response["status"] = make_status(StatusCode::OK);
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();

    uint16_t port = 0;
    sidecar::SidecarError error;
    nlohmann::json sidecar_json = {{"state", "EMPTY"}, {"port", nullptr}};
    if (commands_.sidecar_port(port, error)) {
        sidecar_json = {{"state", "READY"}, {"port", port}};
    }

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"uptime_seconds", uptime}, {"sidecar", sidecar_json}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace littera
