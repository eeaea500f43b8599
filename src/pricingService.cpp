#include "parking/pricingService.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std;

namespace parking {

HourlyPricingService::HourlyPricingService(double ratePerUnit, chrono::seconds unit,
                                           BillingMode mode)
  : ratePerUnit_(ratePerUnit), unit_(unit), mode_(mode) {
  if (!(ratePerUnit >= 0.0) || !isfinite(ratePerUnit))
    throw invalid_argument("rate per unit must be finite and non-negative");
  if (unit.count() <= 0) throw invalid_argument("billing unit must be positive");
}

double HourlyPricingService::calculatePrice(TimePoint entry, TimePoint exit) const {
  if (exit < entry) throw invalid_argument("exit time is before entry time");

  chrono::duration<double> elapsed = exit - entry;
  double units = elapsed.count() / static_cast<double>(unit_.count());
  if (mode_ == BillingMode::WHOLE_UNITS) units = ceil(units);
  units = max(1.0, units);

  return round(units * ratePerUnit_ * 100.0) / 100.0;
}

} // namespace parking
