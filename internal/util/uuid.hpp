#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace fwbuild::util {

/*
  UUID helpers

  Build ids are random RFC4122 version 4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace fwbuild::util
