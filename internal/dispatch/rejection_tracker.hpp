#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "internal/config/dispatch_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace ridedispatch::dispatch {

enum class RejectOutcome {
  kRecorded,
  kNotFound,
  kNotNotified,
  kAlreadyResolved,
};

std::string_view ToString(RejectOutcome outcome);

struct RejectResult {
  RejectOutcome outcome = RejectOutcome::kNotFound;
  std::string   message;

  uint32_t rejection_count   = 0;
  uint32_t remaining_drivers = 0;  // notified and not yet declined
};

// Records a driver declining an offer. The ride stays REQUESTED.
class RejectionTracker {
 public:
  RejectionTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                   config::DispatchPolicy policy);

  RejectResult Reject(const std::string& ride_id, const std::string& driver_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  config::DispatchPolicy          policy_;
};

} // namespace ridedispatch::dispatch
