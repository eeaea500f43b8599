#include "parking/vehicle.h"

#include <algorithm>
#include <cctype>

using namespace std;

namespace parking {

const char* toString(VehicleCategory category) {
  switch (category) {
    case VehicleCategory::CAR:  return "CAR";
    case VehicleCategory::BIKE: return "BIKE";
  }
  return "UNKNOWN";
}

optional<VehicleCategory> parseVehicleCategory(const string& name) {
  string upper = name;
  transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c) { return static_cast<char>(toupper(c)); });
  if (upper == "CAR") return VehicleCategory::CAR;
  if (upper == "BIKE") return VehicleCategory::BIKE;
  return nullopt;
}

} // namespace parking
