#pragma once

#include "internal/config/dispatch_policy.hpp"
#include "internal/db/model/ride_record.hpp"

namespace ridedispatch::fare {

struct FareQuote {
  db::model::FareBreakdown breakdown;  // per_km is the blended rate past the tier threshold
  double                   distance_charge = 0.0;
  double                   total           = 0.0;
  bool                     fare_protected  = false;  // estimate charged instead of the metered fare
};

/*
  Tiered distance fare.

    total = (base + min(d, T) * per_km + max(d - T, 0) * extended_per_km) * surge

  Amounts are rounded to 2 decimals.
*/
class FareCalculator {
 public:
  explicit FareCalculator(config::FarePolicy policy);

  // InvalidArgument on negative distance or surge below 1.0.
  FareQuote Estimate(double distance_km, double surge = 1.0) const;

  /*
    Fare for a completed ride. If the metered fare differs from the estimate
    by more than protection_ratio of the estimate, the estimate is charged.
  */
  FareQuote Actual(double actual_distance_km, double estimated_fare, double surge = 1.0) const;

  double RiderCancellationFee() const {
    return policy_.rider_cancellation_fee;
  }

  const config::FarePolicy& Policy() const {
    return policy_;
  }

 private:
  config::FarePolicy policy_;
};

double RoundCurrency(double amount);

} // namespace ridedispatch::fare
