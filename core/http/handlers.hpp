#pragma once

/**
 * @brief HTTP Route Handlers
 *
 * All route handlers are defined as methods on HttpServer.
 * Implementation is in handlers/command_handlers.cpp.
 *
 * Endpoints (v0):
 * - GET  /v0/sidecar/port      -> handle_get_sidecar_port
 * - POST /v0/work/open         -> handle_post_open_work    {"path": "..."}
 * - POST /v0/work/close        -> handle_post_close_work
 * - POST /v0/work/init         -> handle_post_init_work    {"path": "..."}
 * - GET  /v0/picker            -> handle_get_picker
 * - PUT  /v0/workspace         -> handle_put_workspace     {"path": "..."}
 * - GET  /v0/runtime/status    -> handle_get_runtime_status
 *
 * All responses use JSON and include a top-level "status" object.
 * Failed commands also carry an "error" field naming the failure kind
 * (NOT_READY, LAUNCH_FAILED, READY_TIMEOUT, ...).
 */

// Handler implementations are part of HttpServer class in server.hpp
