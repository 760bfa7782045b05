#pragma once

#include <cstdint>
#include <string>

namespace ridedispatch::db::model {

/*
  Arbitration lock row.

  Acquire succeeds only if no row with the same key has expires_at_ms > now.
  Release deletes the row only when the owner token matches, so a holder whose
  lease already expired cannot drop a successor's lease.
*/
struct LeaseRecord {
  std::string key;
  std::string owner;

  uint64_t acquired_at_ms = 0;
  uint64_t expires_at_ms  = 0;
};

} // namespace ridedispatch::db::model
