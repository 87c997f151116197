#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace littera
{
    namespace http
    {

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(), "application/json");
        }

        // Helper: Send the error envelope for a failed command
        inline void send_error(httplib::Response &res, const sidecar::SidecarError &error)
        {
            send_json(res, status_for_error(error.code), make_error_response(error));
        }

        // Helper: Extract a required non-empty string "path" from a JSON body.
        // Sends a 400 response and returns false when missing or malformed.
        inline bool parse_path_body(const httplib::Request &req, httplib::Response &res, std::string &path)
        {
            nlohmann::json body;
            try
            {
                body = nlohmann::json::parse(req.body);
            }
            catch (const nlohmann::json::exception &e)
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what()));
                return false;
            }

            if (!body.is_object() || !body.contains("path") || !body["path"].is_string() ||
                body["path"].get<std::string>().empty())
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT,
                                              "Missing or invalid 'path' field (expected non-empty string)"));
                return false;
            }

            path = body["path"].get<std::string>();
            return true;
        }

    } // namespace http
} // namespace littera
