#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "sidecar/sidecar_error.hpp"

namespace littera
{
    namespace http
    {

        /**
         * @brief Response status carried in every body's "status" object
         *
         * The HTTP status line is derived from it (see status_info).
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            UNAVAILABLE,
            DEADLINE_EXCEEDED,
            INTERNAL
        };

        struct StatusInfo
        {
            int http;
            const char *name;
        };

        inline StatusInfo status_info(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return {200, "OK"};
            case StatusCode::INVALID_ARGUMENT:
                return {400, "INVALID_ARGUMENT"};
            case StatusCode::NOT_FOUND:
                return {404, "NOT_FOUND"};
            case StatusCode::UNAVAILABLE:
                return {503, "UNAVAILABLE"};
            case StatusCode::DEADLINE_EXCEEDED:
                return {504, "DEADLINE_EXCEEDED"};
            case StatusCode::INTERNAL:
                break;
            }
            return {500, "INTERNAL"};
        }

        inline int status_code_to_http(StatusCode code) { return status_info(code).http; }

        inline std::string status_code_to_string(StatusCode code) { return status_info(code).name; }

        /**
         * @brief Map a command failure onto a response status
         *
         * No worker -> 503, rejected work directory -> 400, handshake deadline -> 504.
         * Spawn, handshake, lock and init failures are all 500.
         */
        inline StatusCode status_for_error(sidecar::ErrorCode code)
        {
            switch (code)
            {
            case sidecar::ErrorCode::NONE:
                return StatusCode::OK;
            case sidecar::ErrorCode::NOT_READY:
                return StatusCode::UNAVAILABLE;
            case sidecar::ErrorCode::INVALID_WORK_DIR:
                return StatusCode::INVALID_ARGUMENT;
            case sidecar::ErrorCode::READY_TIMEOUT:
                return StatusCode::DEADLINE_EXCEEDED;
            default:
                return StatusCode::INTERNAL;
            }
        }

        // {"code": "...", "message": "..."}; an empty message falls back to "ok" or the code name
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            nlohmann::json status;
            status["code"] = status_code_to_string(code);
            if (!message.empty())
            {
                status["message"] = message;
            }
            else
            {
                status["message"] = code == StatusCode::OK ? "ok" : status_code_to_string(code);
            }
            return status;
        }

        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            nlohmann::json response;
            response["status"] = make_status(code, message);
            return response;
        }

        /**
         * @brief Error body for a failed command
         *
         * Adds "error" with the failure kind (e.g. "LAUNCH_FAILED"), since several
         * kinds share HTTP 500.
         */
        inline nlohmann::json make_error_response(const sidecar::SidecarError &error)
        {
            nlohmann::json response = make_error_response(status_for_error(error.code), error.message);
            response["error"] = sidecar::error_code_to_string(error.code);
            return response;
        }

    } // namespace http
} // namespace littera
