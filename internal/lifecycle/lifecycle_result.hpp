#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/ride_record.hpp"

namespace ridedispatch::lifecycle {

enum class LifecycleOutcome {
  kOk,
  kNotFound,
  kNotParticipant,   // caller is not the ride's rider/driver
  kInvalidState,     // transition not allowed from the current status
  kInvalidArgument,
};

constexpr std::string_view ToString(LifecycleOutcome outcome) {
  switch (outcome) {
    case LifecycleOutcome::kOk:
      return "ok";
    case LifecycleOutcome::kNotFound:
      return "not_found";
    case LifecycleOutcome::kNotParticipant:
      return "not_participant";
    case LifecycleOutcome::kInvalidState:
      return "invalid_state";
    case LifecycleOutcome::kInvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

struct LifecycleResult {
  LifecycleOutcome outcome = LifecycleOutcome::kOk;
  std::string      message;

  std::optional<db::model::RideRecord> ride;

  bool ok() const {
    return outcome == LifecycleOutcome::kOk;
  }
};

} // namespace ridedispatch::lifecycle
