#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace jobhub::util {

/*
  UUID helpers

  Job and execution ids are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string GenerateId();

} // namespace jobhub::util
