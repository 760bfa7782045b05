#pragma once

#include <chrono>
#include <string>

namespace ridedispatch::lease {

struct Lease {
  std::string key;
  std::string owner; // random token identifying this holder

  std::chrono::system_clock::time_point expires_at;
};

} // namespace ridedispatch::lease
