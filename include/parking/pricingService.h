#pragma once

#include <chrono>

#include "parking/clock.h"

namespace parking {

class PricingService {
public:
  virtual ~PricingService() = default;

  /**
   * @brief Fee for a stay from entry to exit.
   * @throws std::invalid_argument if exit is before entry
   */
  virtual double calculatePrice(TimePoint entry, TimePoint exit) const = 0;
};

enum class BillingMode {
  PRORATED,     // max(1, elapsed/unit) * rate
  WHOLE_UNITS   // max(1, ceil(elapsed/unit)) * rate
};

class HourlyPricingService : public PricingService {
public:
  explicit HourlyPricingService(double ratePerUnit = 50.0,
                                std::chrono::seconds unit = std::chrono::hours(1),
                                BillingMode mode = BillingMode::PRORATED);

  double calculatePrice(TimePoint entry, TimePoint exit) const override;

private:
  double ratePerUnit_;
  std::chrono::seconds unit_;
  BillingMode mode_;
};

} // namespace parking
