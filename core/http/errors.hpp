#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace vrm
{
    namespace http
    {

        /**
         * @brief Service status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - UPSTREAM_ERROR -> upstream status passthrough (502 when unknown)
         * - UNAVAILABLE -> HTTP 503
         * - DEADLINE_EXCEEDED -> HTTP 504
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            UPSTREAM_ERROR,
            UNAVAILABLE,
            DEADLINE_EXCEEDED,
            INTERNAL
        };

        /**
         * @brief Convert StatusCode to HTTP status integer
         */
        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::UPSTREAM_ERROR:
                return 502;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::DEADLINE_EXCEEDED:
                return 504;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        /**
         * @brief Convert StatusCode to string representation
         */
        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::UPSTREAM_ERROR:
                return "UPSTREAM_ERROR";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::DEADLINE_EXCEEDED:
                return "DEADLINE_EXCEEDED";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Pick the status code for an upstream failure with the given HTTP status
         *
         * 503/504 keep their own codes; everything else is UPSTREAM_ERROR.
         */
        inline StatusCode status_code_for_upstream(int http_status)
        {
            switch (http_status)
            {
            case 503:
                return StatusCode::UNAVAILABLE;
            case 504:
                return StatusCode::DEADLINE_EXCEEDED;
            default:
                return StatusCode::UPSTREAM_ERROR;
            }
        }

        /**
         * @brief Build a JSON status object
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        /**
         * @brief Build a complete JSON error response
         *
         * {"status": {"code", "message"}, "detail": message}. "detail" carries
         * the same text for clients written against the original API.
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            nlohmann::json status = make_status(code, message);
            std::string detail = status["message"].get<std::string>();
            return {
                {"status", std::move(status)},
                {"detail", detail}};
        }

    } // namespace http
} // namespace vrm
