#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace vrm {
namespace lookup {

// Reduced view of an upstream vehicle record. A field is empty when the
// upstream omitted it or sent a value of the wrong JSON type.
struct VehicleDetails {
    std::optional<std::string> make;
    std::optional<std::string> model;
    std::optional<std::string> colour;
    std::optional<int64_t> year_of_manufacture;
    std::optional<std::string> fuel_type;
};

}  // namespace lookup
}  // namespace vrm
