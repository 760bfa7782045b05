#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "broadcast_coordinator.hpp"

namespace ridedispatch::dispatch {

enum class ExpandOutcome {
  kExpanded,
  kNotFound,      // ride or active broadcast missing
  kNotRequested,  // ride already matched or cancelled
};

std::string_view ToString(ExpandOutcome outcome);

struct ExpandResult {
  ExpandOutcome outcome = ExpandOutcome::kNotFound;
  std::string   message;

  double                      previous_radius_km = 0.0;
  double                      new_radius_km      = 0.0;
  uint32_t                    broadcast_count    = 0;
  std::vector<NotifiedDriver> newly_included;  // closest first
  uint32_t                    total_notified = 0;
};

/*
  Widens a live broadcast and offers the ride to drivers inside the new
  radius that were not offered it before. Re-running with the same radius
  notifies nobody twice. The stored radius never shrinks.
*/
class RadiusExpander {
 public:
  RadiusExpander(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                 std::shared_ptr<BroadcastCoordinator> broadcasts);

  // current_radius_km defaults to the stored radius, increment_km to the
  // area's expansion step. InvalidArgument for a non-positive increment.
  ExpandResult Expand(const std::string& ride_id, std::optional<double> current_radius_km = std::nullopt,
                      std::optional<double> increment_km = std::nullopt);

 private:
  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<util::Clock>          clock_;
  std::shared_ptr<BroadcastCoordinator> broadcasts_;
};

} // namespace ridedispatch::dispatch
