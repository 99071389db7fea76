#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace vrm
{
    namespace http
    {

        constexpr const char *kJsonContentType = "application/json";

        // Helper: Send JSON response with an explicit HTTP status
        inline void send_json(httplib::Response &res, int http_status, const nlohmann::json &body)
        {
            res.status = http_status;
            // Replace invalid UTF-8 from upstream text instead of throwing mid-response
            res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), kJsonContentType);
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            send_json(res, status_code_to_http(code), body);
        }

        // Helper: Send error envelope
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

    } // namespace http
} // namespace vrm
