#include <cassert>
#include <iostream>

#include "internal/fare/fare_calculator.hpp"
#include "internal/util/errors.hpp"

namespace {

using ridedispatch::config::FarePolicy;
using ridedispatch::fare::FareCalculator;
using ridedispatch::fare::RoundCurrency;

bool Eq(double a, double b) {
  return a > b ? a - b < 1e-9 : b - a < 1e-9;
}

void TestShortTripUsesBaseRate() {
  FareCalculator fares{FarePolicy{}};

  auto quote = fares.Estimate(5.0);
  assert(Eq(quote.total, 90.0));
  assert(Eq(quote.distance_charge, 60.0));
  assert(Eq(quote.breakdown.base, 30.0));
  assert(Eq(quote.breakdown.per_km, 12.0));
  assert(Eq(quote.breakdown.surge, 1.0));
  assert(Eq(quote.breakdown.final_total, 90.0));

  assert(Eq(fares.Estimate(0.0).total, 30.0));
}

void TestLongTripUsesCheaperTier() {
  FareCalculator fares{FarePolicy{}};

  // 25km at 12 + 5km at 10
  auto quote = fares.Estimate(30.0);
  assert(Eq(quote.distance_charge, 350.0));
  assert(Eq(quote.total, 380.0));
  assert(Eq(quote.breakdown.per_km, 11.67));

  // threshold itself is still the first tier
  assert(Eq(fares.Estimate(25.0).total, 330.0));
}

void TestSurgeMultipliesTotal() {
  FareCalculator fares{FarePolicy{}};
  assert(Eq(fares.Estimate(5.0, 1.5).total, 135.0));
}

void TestInvalidInputsThrow() {
  FareCalculator fares{FarePolicy{}};

  bool threw = false;
  try {
    fares.Estimate(-1.0);
  } catch (const ridedispatch::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    fares.Estimate(3.0, 0.9);
  } catch (const ridedispatch::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestFareProtection() {
  FareCalculator fares{FarePolicy{}};

  // metered 126 against an estimate of 90: 40% off, the estimate is charged
  assert(Eq(fares.Actual(8.0, 90.0).total, 90.0));
  // metered 54: also 40% off
  assert(Eq(fares.Actual(2.0, 90.0).total, 90.0));
  // metered 96: within 20%, charged as metered
  assert(Eq(fares.Actual(5.5, 90.0).total, 96.0));
  // exactly 20% is still within tolerance
  assert(Eq(fares.Actual(6.5, 90.0).total, 108.0));

  auto protected_quote = fares.Actual(8.0, 90.0);
  assert(Eq(protected_quote.breakdown.final_total, 90.0));
  assert(Eq(protected_quote.breakdown.distance_km, 8.0));
  assert(protected_quote.fare_protected);
  assert(!fares.Actual(5.5, 90.0).fare_protected);
}

void TestCustomPolicy() {
  FarePolicy policy;
  policy.base_fare        = 50.0;
  policy.per_km           = 20.0;
  policy.protection_ratio = 0.5;

  FareCalculator fares{policy};
  assert(Eq(fares.Estimate(2.0).total, 90.0));
  // 130 against 90 is 44% off: tolerated under a 50% ratio
  assert(Eq(fares.Actual(4.0, 90.0).total, 130.0));
  assert(Eq(fares.RiderCancellationFee(), 20.0));
}

void TestRounding() {
  assert(Eq(RoundCurrency(10.004), 10.0));
  assert(Eq(RoundCurrency(10.006), 10.01));
  assert(Eq(RoundCurrency(0.0), 0.0));
}

} // namespace

int main() {
  TestShortTripUsesBaseRate();
  TestLongTripUsesCheaperTier();
  TestSurgeMultipliesTotal();
  TestInvalidInputsThrow();
  TestFareProtection();
  TestCustomPolicy();
  TestRounding();

  std::cout << "ride_dispatch_unit_fare_calculator: pass\n";
  return 0;
}
