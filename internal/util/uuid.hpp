#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace mediaforge::util {

/*
  UUID helpers

  Task and asset ids are random RFC4122 v4 UUIDs in canonical string form.
  They double as directory names, so the string form never contains a
  path separator.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace mediaforge::util
