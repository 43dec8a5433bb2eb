#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fieldsync::model {

// Persisted as INTEGER; values must never be renumbered.
enum class PhotoClassification : std::uint8_t {
  kPressure  = 0,
  kCondition = 1,
  kDataplate = 2,
  kOther     = 3,
};

constexpr std::string_view ToString(PhotoClassification classification) {
  switch (classification) {
    case PhotoClassification::kPressure:
      return "pressure";
    case PhotoClassification::kCondition:
      return "condition";
    case PhotoClassification::kDataplate:
      return "dataplate";
    case PhotoClassification::kOther:
      return "other";
  }
  return "unknown";
}

std::optional<PhotoClassification> ParsePhotoClassification(std::string_view value);

} // namespace fieldsync::model
