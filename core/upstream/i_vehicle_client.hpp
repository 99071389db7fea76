#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace vrm {
namespace upstream {

enum class UpstreamOutcome {
    FOUND,           // 200 with a vehicle record
    NOT_FOUND,       // 400/404, or an empty record
    NOT_CONFIGURED,  // no API key; no request was made
    FAILED           // any other status, or a transport failure
};

inline const char *outcome_to_string(UpstreamOutcome outcome) {
    switch (outcome) {
        case UpstreamOutcome::FOUND:
            return "FOUND";
        case UpstreamOutcome::NOT_FOUND:
            return "NOT_FOUND";
        case UpstreamOutcome::NOT_CONFIGURED:
            return "NOT_CONFIGURED";
        case UpstreamOutcome::FAILED:
            return "FAILED";
    }
    return "FAILED";
}

struct UpstreamResult {
    UpstreamOutcome outcome = UpstreamOutcome::NOT_FOUND;
    int http_status = 0;    // Upstream status, or 502/503/504 for local transport failures
    std::string message;    // Set for FAILED
    nlohmann::json record;  // Set for FOUND
};

// Interface for the vehicle-data client to enable mocking
class IVehicleClient {
public:
    virtual ~IVehicleClient() = default;

    virtual bool is_configured() const = 0;

    // One outbound request for an already normalized registration number.
    // Must be safe to call from concurrent request handlers.
    virtual UpstreamResult lookup(const std::string &registration_number) = 0;
};

}  // namespace upstream
}  // namespace vrm
