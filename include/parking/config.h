#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "parking/clock.h"
#include "parking/floor.h"
#include "parking/logger.h"
#include "parking/parkingService.h"
#include "parking/pricingService.h"
#include "parking/vehicle.h"

namespace parking {

struct SlotConfig {
  int id;
  VehicleCategory category;
};

struct FloorConfig {
  int id;
  std::vector<SlotConfig> slots;
};

namespace Config {
  namespace Defaults {
    constexpr double RATE_PER_UNIT = 50.0;
    constexpr long BILLING_UNIT_SECONDS = 3600;
    constexpr BillingMode BILLING_MODE = BillingMode::PRORATED;
    constexpr Logger::Level LOG_LEVEL = Logger::Level::INFO;
  }

  /**
   * @brief Load KEY=VALUE lines from an env file into the environment.
   *
   * Blank lines and lines starting with '#' are skipped, an "export "
   * prefix is accepted. Variables already set are not overwritten.
   *
   * @throws std::runtime_error if the file cannot be opened
   */
  void loadEnvFile(const std::string& path);
}

struct FacilityConfig {
  std::vector<FloorConfig> floors;
  double ratePerUnit = Config::Defaults::RATE_PER_UNIT;
  std::chrono::seconds billingUnit{Config::Defaults::BILLING_UNIT_SECONDS};
  BillingMode billingMode = Config::Defaults::BILLING_MODE;
  Logger::Level logLevel = Config::Defaults::LOG_LEVEL;
};

// Two floors: 1 = {6 BIKE, 3 CAR, 1 CAR}, 2 = {2 CAR, 4 BIKE, 5 BIKE}
FacilityConfig defaultFacility();

/**
 * @brief Parse "floorId:slotId=CATEGORY,...;floorId:..." into floors.
 *
 * Example: "1:6=BIKE,3=CAR,1=CAR;2:2=CAR,4=BIKE,5=BIKE"
 *
 * @throws std::invalid_argument on malformed input
 */
std::vector<FloorConfig> parseLayout(const std::string& layout);

/**
 * @brief Override fields from PARKING_LAYOUT, PARKING_RATE_PER_UNIT,
 *        PARKING_BILLING_UNIT_SECONDS, PARKING_BILLING_MODE and
 *        PARKING_LOG_LEVEL when they are set.
 * @throws std::invalid_argument if a variable holds an unusable value
 */
void applyEnvOverrides(FacilityConfig& config);

/**
 * @throws std::invalid_argument on duplicate floor or slot ids
 */
std::vector<ParkingFloor> buildFloors(const FacilityConfig& config);

// Nearest-slot allocation and hourly pricing over the configured floors.
std::unique_ptr<ParkingService> makeParkingService(
    const FacilityConfig& config,
    std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

} // namespace parking
