#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace jobmeter::util {

/*
  UUID helpers

  Job ids are RFC4122 version 4 UUIDs persisted in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewJobId();

bool IsValidUUID(const std::string& str);

} // namespace jobmeter::util
