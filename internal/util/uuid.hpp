#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace statecore::util {

/*
  UUID helpers

  Event ids and lock ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string GenerateUUIDString() {
  return ToString(GenerateUUID());
}

} // namespace statecore::util
