#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "upstream/i_vehicle_client.hpp"
#include "vehicle_details.hpp"

namespace vrm {
namespace lookup {

constexpr const char *kPlateRequiredMessage = "plate required";
constexpr const char *kVehicleNotFoundMessage = "Vehicle not found";

enum class LookupStatus {
    OK,               // 200 with vehicle details
    BAD_REQUEST,      // plate empty after trimming
    NOT_FOUND,        // upstream had no record, or no API key is configured
    UPSTREAM_FAILURE  // upstream status/transport failure, passed through
};

const char *lookup_status_to_string(LookupStatus status);

struct LookupResult {
    LookupStatus status = LookupStatus::OK;
    VehicleDetails vehicle;  // Set for OK
    int http_status = 200;   // Status to report to the caller
    std::string message;     // Set for every non-OK status
};

/**
 * @brief Pick the five reported fields out of an upstream vehicle record
 *
 * make, model, colour, yearOfManufacture and fuelType; a missing field, or
 * one with an unexpected JSON type, is left empty.
 */
VehicleDetails extract_vehicle_details(const nlohmann::json &record);

/**
 * @brief Plate lookup request flow
 *
 * Received -> Validated -> UpstreamQueried -> Completed | NotFound | Failed.
 * Every terminal state is reached in one pass; nothing is retried.
 *
 * A missing API key is reported as NOT_FOUND to the caller (compatible with
 * existing clients) but logged as a configuration warning.
 *
 * Thread-safe as long as the vehicle client is.
 */
class LookupService {
public:
    explicit LookupService(upstream::IVehicleClient &client);

    LookupResult lookup(const std::string &raw_plate) const;

private:
    upstream::IVehicleClient &client_;
};

}  // namespace lookup
}  // namespace vrm
