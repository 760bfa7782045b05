#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ridedispatch::util {

// RFC4122 v4; ride ids and lease owner tokens use the canonical text form.
using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace ridedispatch::util
