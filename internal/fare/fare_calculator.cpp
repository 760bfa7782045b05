#include "fare_calculator.hpp"

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace ridedispatch::fare {

double RoundCurrency(double amount) {
  return std::round(amount * 100.0) / 100.0;
}

FareCalculator::FareCalculator(config::FarePolicy policy) : policy_(policy) {
}

FareQuote FareCalculator::Estimate(double distance_km, double surge) const {
  if (!std::isfinite(distance_km) || distance_km < 0.0) {
    throw util::InvalidArgument("distance must be non-negative, got " + std::to_string(distance_km));
  }
  if (!std::isfinite(surge) || surge < 1.0) {
    throw util::InvalidArgument("surge multiplier must be >= 1.0, got " + std::to_string(surge));
  }

  double charge = 0.0;
  double rate   = policy_.per_km;
  if (distance_km <= policy_.tier_threshold_km) {
    charge = distance_km * policy_.per_km;
  } else {
    charge = policy_.tier_threshold_km * policy_.per_km +
             (distance_km - policy_.tier_threshold_km) * policy_.extended_per_km;
    rate = charge / distance_km;
  }

  FareQuote quote;
  quote.breakdown.base        = policy_.base_fare;
  quote.breakdown.per_km      = RoundCurrency(rate);
  quote.breakdown.distance_km = distance_km;
  quote.breakdown.surge       = surge;
  quote.distance_charge       = RoundCurrency(charge);
  quote.total                 = RoundCurrency((policy_.base_fare + charge) * surge);
  quote.breakdown.final_total = quote.total;
  return quote;
}

FareQuote FareCalculator::Actual(double actual_distance_km, double estimated_fare, double surge) const {
  auto quote = Estimate(actual_distance_km, surge);

  if (estimated_fare > 0.0) {
    const double deviation = std::abs(quote.total - estimated_fare) / estimated_fare;
    if (deviation > policy_.protection_ratio) {
      quote.total          = RoundCurrency(estimated_fare);
      quote.fare_protected = true;
    }
  }
  quote.breakdown.final_total = quote.total;
  return quote;
}

} // namespace ridedispatch::fare
