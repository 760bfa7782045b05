#pragma once

#include <cstdint>
#include <string>

namespace ridedispatch::db::model {

struct RejectionRecord {
  std::string ride_id;
  std::string driver_id;

  uint64_t rejected_at_ms = 0;
  uint64_t expires_at_ms  = 0;
};

} // namespace ridedispatch::db::model
