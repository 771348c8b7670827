#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

namespace refinery::util {

/*
  Identifier helpers

  Issue ids are "<prefix>-<10 hex chars>" drawn from a random RFC4122 UUID.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateIssueId(std::string_view prefix);

} // namespace refinery::util
