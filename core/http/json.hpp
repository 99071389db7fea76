#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "lookup/vehicle_details.hpp"

namespace vrm {
namespace http {

constexpr const char *kServiceName = "UK VRM Lookup";
constexpr const char *kServiceVersion = "1.0.0";
constexpr const char *kDocsPath = "/docs";

/**
 * @brief JSON encoding utilities for the lookup API
 *
 * Response field names are snake_case; absent values encode as null so the
 * response always carries all five keys.
 */
nlohmann::json encode_vehicle_details(const lookup::VehicleDetails &details);

// {"service", "version", "docs"}
nlohmann::json encode_service_info();

// OpenAPI 3 description of the public endpoints
nlohmann::json build_openapi_document();

// Decode {"plate": "..."}; the plate is returned untrimmed
bool decode_lookup_request(const nlohmann::json &json, std::string &plate, std::string &error);

}  // namespace http
}  // namespace vrm
