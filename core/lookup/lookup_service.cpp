#include "lookup_service.hpp"

#include "logging/logger.hpp"
#include "plate.hpp"

namespace vrm {
namespace lookup {

namespace {

std::optional<std::string> string_field(const nlohmann::json &record, const char *name) {
    auto it = record.find(name);
    if (it == record.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<int64_t> integer_field(const nlohmann::json &record, const char *name) {
    auto it = record.find(name);
    if (it == record.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<int64_t>();
}

LookupResult not_found() {
    LookupResult result;
    result.status = LookupStatus::NOT_FOUND;
    result.http_status = 404;
    result.message = kVehicleNotFoundMessage;
    return result;
}

}  // namespace

const char *lookup_status_to_string(LookupStatus status) {
    switch (status) {
        case LookupStatus::OK:
            return "OK";
        case LookupStatus::BAD_REQUEST:
            return "BAD_REQUEST";
        case LookupStatus::NOT_FOUND:
            return "NOT_FOUND";
        case LookupStatus::UPSTREAM_FAILURE:
            return "UPSTREAM_FAILURE";
    }
    return "UPSTREAM_FAILURE";
}

VehicleDetails extract_vehicle_details(const nlohmann::json &record) {
    VehicleDetails details;
    if (!record.is_object()) {
        return details;
    }

    details.make = string_field(record, "make");
    details.model = string_field(record, "model");
    details.colour = string_field(record, "colour");
    details.year_of_manufacture = integer_field(record, "yearOfManufacture");
    details.fuel_type = string_field(record, "fuelType");
    return details;
}

LookupService::LookupService(upstream::IVehicleClient &client) : client_(client) {}

LookupResult LookupService::lookup(const std::string &raw_plate) const {
    // Received -> Validated
    const std::string plate = trim(raw_plate);
    if (plate.empty()) {
        LookupResult result;
        result.status = LookupStatus::BAD_REQUEST;
        result.http_status = 400;
        result.message = kPlateRequiredMessage;
        return result;
    }

    // Validated -> UpstreamQueried
    const std::string registration_number = normalize_plate(plate);
    LOG_DEBUG("[Lookup] Querying upstream for " << registration_number);

    const upstream::UpstreamResult upstream_result = client_.lookup(registration_number);
    LOG_DEBUG("[Lookup] Upstream outcome for " << registration_number << ": "
                                               << upstream::outcome_to_string(upstream_result.outcome));

    switch (upstream_result.outcome) {
        case upstream::UpstreamOutcome::FOUND: {
            LookupResult result;
            result.status = LookupStatus::OK;
            result.http_status = 200;
            result.vehicle = extract_vehicle_details(upstream_result.record);
            return result;
        }
        case upstream::UpstreamOutcome::NOT_FOUND:
            return not_found();
        case upstream::UpstreamOutcome::NOT_CONFIGURED:
            LOG_WARN("[Lookup] Upstream API key not configured; reporting not found");
            return not_found();
        case upstream::UpstreamOutcome::FAILED:
            break;
    }

    LookupResult result;
    result.status = LookupStatus::UPSTREAM_FAILURE;
    result.http_status = upstream_result.http_status;
    result.message = upstream_result.message;
    return result;
}

}  // namespace lookup
}  // namespace vrm
