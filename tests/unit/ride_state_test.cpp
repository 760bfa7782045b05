#include <cassert>
#include <iostream>

#include "internal/model/ride_state.hpp"

namespace {

using ridedispatch::model::CanTransition;
using ridedispatch::model::IsMatchedOrLater;
using ridedispatch::model::IsTerminal;
using ridedispatch::model::kAllRideStatuses;
using ridedispatch::model::RideStatus;

void TestForwardPath() {
  assert(CanTransition(RideStatus::kRequested, RideStatus::kMatched));
  assert(CanTransition(RideStatus::kMatched, RideStatus::kDriverArriving));
  assert(CanTransition(RideStatus::kDriverArriving, RideStatus::kInProgress));
  assert(CanTransition(RideStatus::kInProgress, RideStatus::kCompleted));
}

void TestCancellationOnlyBeforeTrip() {
  assert(CanTransition(RideStatus::kRequested, RideStatus::kCancelled));
  assert(CanTransition(RideStatus::kMatched, RideStatus::kCancelled));
  assert(CanTransition(RideStatus::kDriverArriving, RideStatus::kCancelled));
  assert(!CanTransition(RideStatus::kInProgress, RideStatus::kCancelled));
}

void TestTerminalStatesAreFinal() {
  for (auto to : kAllRideStatuses) {
    assert(!CanTransition(RideStatus::kCompleted, to));
    assert(!CanTransition(RideStatus::kCancelled, to));
  }
  assert(IsTerminal(RideStatus::kCompleted));
  assert(IsTerminal(RideStatus::kCancelled));
  assert(!IsTerminal(RideStatus::kInProgress));
}

void TestNoSelfOrSkippingTransitions() {
  for (auto s : kAllRideStatuses) assert(!CanTransition(s, s));

  assert(!CanTransition(RideStatus::kRequested, RideStatus::kInProgress));
  assert(!CanTransition(RideStatus::kRequested, RideStatus::kCompleted));
  assert(!CanTransition(RideStatus::kMatched, RideStatus::kCompleted));
  assert(!CanTransition(RideStatus::kMatched, RideStatus::kRequested));
}

void TestMatchedOrLater() {
  assert(!IsMatchedOrLater(RideStatus::kRequested));
  assert(IsMatchedOrLater(RideStatus::kMatched));
  assert(IsMatchedOrLater(RideStatus::kDriverArriving));
  assert(IsMatchedOrLater(RideStatus::kInProgress));
  assert(IsMatchedOrLater(RideStatus::kCompleted));
  assert(!IsMatchedOrLater(RideStatus::kCancelled));
}

void TestStorageCodec() {
  for (auto s : kAllRideStatuses) {
    assert(ridedispatch::model::RideStatusFromInt(static_cast<int>(s)) == s);
  }
  assert(!ridedispatch::model::RideStatusFromInt(0));
  assert(!ridedispatch::model::RideStatusFromInt(7));
  assert(!ridedispatch::model::DriverStatusFromInt(4));
}

} // namespace

int main() {
  TestForwardPath();
  TestCancellationOnlyBeforeTrip();
  TestTerminalStatesAreFinal();
  TestNoSelfOrSkippingTransitions();
  TestMatchedOrLater();
  TestStorageCodec();

  std::cout << "ride_dispatch_unit_ride_state: pass\n";
  return 0;
}
