#include "json.hpp"

#include "lookup/lookup_service.hpp"

namespace vrm {
namespace http {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T> &value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

nlohmann::json nullable(const char *type) { return {{"type", type}, {"nullable", true}}; }

nlohmann::json error_schema_ref() { return {{"$ref", "#/components/schemas/Error"}}; }

nlohmann::json json_content(const nlohmann::json &schema) {
    return {{"application/json", {{"schema", schema}}}};
}

}  // namespace

nlohmann::json encode_vehicle_details(const lookup::VehicleDetails &details) {
    return {{"make", optional_to_json(details.make)},
            {"model", optional_to_json(details.model)},
            {"colour", optional_to_json(details.colour)},
            {"year_of_manufacture", optional_to_json(details.year_of_manufacture)},
            {"fuel_type", optional_to_json(details.fuel_type)}};
}

nlohmann::json encode_service_info() {
    return {{"service", kServiceName}, {"version", kServiceVersion}, {"docs", kDocsPath}};
}

bool decode_lookup_request(const nlohmann::json &json, std::string &plate, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    auto it = json.find("plate");
    if (it == json.end() || it->is_null()) {
        error = lookup::kPlateRequiredMessage;
        return false;
    }
    if (!it->is_string()) {
        error = "plate must be a string";
        return false;
    }

    plate = it->get<std::string>();
    return true;
}

nlohmann::json build_openapi_document() {
    nlohmann::json lookup_request = {{"type", "object"},
                                     {"required", nlohmann::json::array({"plate"})},
                                     {"properties",
                                      {{"plate",
                                        {{"type", "string"},
                                         {"description", "UK registration number (e.g., AB12CDE)"}}}}}};

    nlohmann::json lookup_response = {{"type", "object"},
                                      {"properties",
                                       {{"make", nullable("string")},
                                        {"model", nullable("string")},
                                        {"colour", nullable("string")},
                                        {"year_of_manufacture", nullable("integer")},
                                        {"fuel_type", nullable("string")}}}};

    nlohmann::json error = {
        {"type", "object"},
        {"properties",
         {{"status",
           {{"type", "object"},
            {"properties", {{"code", {{"type", "string"}}}, {"message", {{"type", "string"}}}}}}},
          {"detail", {{"type", "string"}}}}}};

    nlohmann::json paths = {
        {"/",
         {{"get",
           {{"summary", "Service metadata"},
            {"responses",
             {{"200",
               {{"description", "Service name, version and docs location"},
                {"content",
                 json_content({{"type", "object"},
                               {"properties",
                                {{"service", {{"type", "string"}}},
                                 {"version", {{"type", "string"}}},
                                 {"docs", {{"type", "string"}}}}}})}}}}}}}}},
        {"/health",
         {{"get",
           {{"summary", "Liveness check"},
            {"responses",
             {{"200",
               {{"description", "Service is running"},
                {"content",
                 json_content({{"type", "object"}, {"properties", {{"ok", {{"type", "boolean"}}}}}})}}}}}}}}},
        {"/lookup",
         {{"post",
           {{"summary", "Lookup UK vehicle details by registration number"},
            {"requestBody",
             {{"required", true}, {"content", json_content({{"$ref", "#/components/schemas/LookupRequest"}})}}},
            {"responses",
             {{"200",
               {{"description", "Vehicle details (make, model, colour, year, fuel type)"},
                {"content", json_content({{"$ref", "#/components/schemas/LookupResponse"}})}}},
              {"400", {{"description", "Plate missing or empty"}, {"content", json_content(error_schema_ref())}}},
              {"404", {{"description", "Vehicle not found"}, {"content", json_content(error_schema_ref())}}},
              {"default",
               {{"description", "Upstream failure (upstream status passed through)"},
                {"content", json_content(error_schema_ref())}}}}}}}}}};

    return {{"openapi", "3.0.3"},
            {"info",
             {{"title", kServiceName},
              {"version", kServiceVersion},
              {"description", "UK vehicle registration lookup via the DVLA Vehicle Enquiry Service"}}},
            {"paths", paths},
            {"components",
             {{"schemas",
               {{"LookupRequest", lookup_request}, {"LookupResponse", lookup_response}, {"Error", error}}}}}};
}

}  // namespace http
}  // namespace vrm
