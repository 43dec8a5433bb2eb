#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace fieldsync::util {

/*
  UUID helpers

  Photo and inspection ids are RFC4122 version 4 UUIDs in canonical
  lower-case text form, optionally behind a short prefix.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// "<prefix><uuid>", e.g. GenerateId("insp-").
std::string GenerateId(std::string_view prefix = {});

bool IsCanonicalUUID(std::string_view text);

} // namespace fieldsync::util
