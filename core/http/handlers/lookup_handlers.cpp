#include "../../logging/logger.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace vrm {
namespace http {

//=============================================================================
// POST /lookup
//=============================================================================
void HttpServer::handle_post_lookup(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const std::exception &e) {
        send_error(res, StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what());
        return;
    }

    std::string plate;
    std::string error;
    if (!decode_lookup_request(body, plate, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    const lookup::LookupResult result = lookup_service_.lookup(plate);
    LOG_DEBUG("[HTTP] POST /lookup -> " << lookup::lookup_status_to_string(result.status));

    switch (result.status) {
        case lookup::LookupStatus::OK:
            send_json(res, StatusCode::OK, encode_vehicle_details(result.vehicle));
            return;
        case lookup::LookupStatus::BAD_REQUEST:
            send_error(res, StatusCode::INVALID_ARGUMENT, result.message);
            return;
        case lookup::LookupStatus::NOT_FOUND:
            send_error(res, StatusCode::NOT_FOUND, result.message);
            return;
        case lookup::LookupStatus::UPSTREAM_FAILURE:
            break;
    }

    // Upstream status is passed through as-is
    LOG_WARN("[HTTP] POST /lookup upstream failure: HTTP " << result.http_status);
    const StatusCode code = status_code_for_upstream(result.http_status);
    const int http_status = result.http_status > 0 ? result.http_status : status_code_to_http(code);
    send_json(res, http_status, make_error_response(code, result.message));
}

}  // namespace http
}  // namespace vrm
