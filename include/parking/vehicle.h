#pragma once

#include <optional>
#include <string>

namespace parking {

enum class VehicleCategory { CAR, BIKE };

const char* toString(VehicleCategory category);

// case-insensitive: "car", "CAR", "Bike", ...
std::optional<VehicleCategory> parseVehicleCategory(const std::string& name);

struct Vehicle {
  std::string id;   // licence plate
  VehicleCategory category;
};

} // namespace parking
