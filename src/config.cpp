#include "parking/config.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace std;

namespace parking {

namespace {

string trim(const string& s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == string::npos) return "";
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

vector<string> split(const string& s, char sep) {
  vector<string> res;
  stringstream ss(s);
  string item;
  while (getline(ss, item, sep)) res.push_back(item);
  return res;
}

int parseId(const string& text, const string& what) {
  string t = trim(text);
  size_t used = 0;
  int value = 0;
  try {
    value = stoi(t, &used);
  } catch (const exception&) {
    throw invalid_argument("bad " + what + " '" + t + "'");
  }
  if (used != t.size()) throw invalid_argument("bad " + what + " '" + t + "'");
  return value;
}

double parseRate(const string& text) {
  string t = trim(text);
  size_t used = 0;
  double value = 0.0;
  try {
    value = stod(t, &used);
  } catch (const exception&) {
    throw invalid_argument("bad PARKING_RATE_PER_UNIT '" + t + "'");
  }
  if (used != t.size() || !isfinite(value))
    throw invalid_argument("bad PARKING_RATE_PER_UNIT '" + t + "'");
  return value;
}

long parseSeconds(const string& text) {
  string t = trim(text);
  size_t used = 0;
  long value = 0;
  try {
    value = stol(t, &used);
  } catch (const exception&) {
    throw invalid_argument("bad PARKING_BILLING_UNIT_SECONDS '" + t + "'");
  }
  if (used != t.size())
    throw invalid_argument("bad PARKING_BILLING_UNIT_SECONDS '" + t + "'");
  return value;
}

const char* getEnvOrNull(const char* name) {
  const char* env = getenv(name);
  return (env && *env) ? env : nullptr;
}

} // namespace

void Config::loadEnvFile(const string& path) {
  ifstream file(path);
  if (!file.is_open()) throw runtime_error("Cannot open: " + path);

  string line;
  while (getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;

    const string exportPrefix = "export ";
    if (line.compare(0, exportPrefix.size(), exportPrefix) == 0)
      line = line.substr(exportPrefix.size());

    auto eqPos = line.find('=');
    if (eqPos == string::npos) continue;

    string key = trim(line.substr(0, eqPos));
    string value = trim(line.substr(eqPos + 1));
    setenv(key.c_str(), value.c_str(), 0);  // keep existing values
  }
}

FacilityConfig defaultFacility() {
  FacilityConfig config;
  config.floors = {
    {1, {{6, VehicleCategory::BIKE}, {3, VehicleCategory::CAR}, {1, VehicleCategory::CAR}}},
    {2, {{2, VehicleCategory::CAR}, {4, VehicleCategory::BIKE}, {5, VehicleCategory::BIKE}}},
  };
  return config;
}

vector<FloorConfig> parseLayout(const string& layout) {
  if (trim(layout).empty()) throw invalid_argument("empty layout");

  vector<FloorConfig> floors;
  for (auto& floorText : split(layout, ';')) {
    if (trim(floorText).empty()) continue;

    auto colon = floorText.find(':');
    if (colon == string::npos)
      throw invalid_argument("floor entry without ':' in '" + trim(floorText) + "'");

    FloorConfig floor{parseId(floorText.substr(0, colon), "floor id"), {}};
    for (auto& slotText : split(floorText.substr(colon + 1), ',')) {
      if (trim(slotText).empty()) continue;

      auto eq = slotText.find('=');
      if (eq == string::npos)
        throw invalid_argument("slot entry without '=' in '" + trim(slotText) + "'");

      auto category = parseVehicleCategory(trim(slotText.substr(eq + 1)));
      if (!category)
        throw invalid_argument("unknown vehicle category '" + trim(slotText.substr(eq + 1)) + "'");

      floor.slots.push_back({parseId(slotText.substr(0, eq), "slot id"), *category});
    }
    floors.push_back(move(floor));
  }

  if (floors.empty()) throw invalid_argument("layout has no floors");
  return floors;
}

void applyEnvOverrides(FacilityConfig& config) {
  if (const char* layout = getEnvOrNull("PARKING_LAYOUT"))
    config.floors = parseLayout(layout);

  if (const char* rate = getEnvOrNull("PARKING_RATE_PER_UNIT"))
    config.ratePerUnit = parseRate(rate);

  if (const char* unit = getEnvOrNull("PARKING_BILLING_UNIT_SECONDS"))
    config.billingUnit = chrono::seconds(parseSeconds(unit));

  if (const char* mode = getEnvOrNull("PARKING_BILLING_MODE")) {
    string m = mode;
    if (m == "prorated") config.billingMode = BillingMode::PRORATED;
    else if (m == "whole") config.billingMode = BillingMode::WHOLE_UNITS;
    else throw invalid_argument("bad PARKING_BILLING_MODE '" + m + "'");
  }

  if (const char* level = getEnvOrNull("PARKING_LOG_LEVEL")) {
    auto parsed = Logger::parseLevel(level);
    if (!parsed) throw invalid_argument(string("bad PARKING_LOG_LEVEL '") + level + "'");
    config.logLevel = *parsed;
  }
}

vector<ParkingFloor> buildFloors(const FacilityConfig& config) {
  set<int> floorIds, slotIds;
  vector<ParkingFloor> floors;
  floors.reserve(config.floors.size());

  for (auto& fc : config.floors) {
    if (!floorIds.insert(fc.id).second)
      throw invalid_argument("duplicate floor id " + to_string(fc.id));

    ParkingFloor floor(fc.id);
    for (auto& sc : fc.slots) {
      if (!slotIds.insert(sc.id).second)
        throw invalid_argument("duplicate slot id " + to_string(sc.id));
      floor.addSlot(sc.id, sc.category);
    }
    floors.push_back(move(floor));
  }
  return floors;
}

unique_ptr<ParkingService> makeParkingService(const FacilityConfig& config,
                                              shared_ptr<Clock> clock) {
  Logger::setLevel(config.logLevel);
  return make_unique<ParkingService>(
      buildFloors(config),
      make_unique<NearestSlotAllocationStrategy>(),
      make_unique<HourlyPricingService>(config.ratePerUnit, config.billingUnit,
                                        config.billingMode),
      move(clock));
}

} // namespace parking
