#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fieldsync::model {

// Persisted as INTEGER; values must never be renumbered.
enum class InspectionStatus : std::uint8_t {
  kPending = 0,
  kSyncing = 1,
  kFailed  = 2,
};

/*
  Lifecycle edges of an inspection record.

    pending -> syncing            (claim)
    failed  -> syncing            (claim of a retry)
    syncing -> failed             (upload failure, stale reclaim)
    any     -> pending            (resave by the capture side)

  Removal on successful sync is not a status; the record is deleted.
*/
constexpr bool CanTransition(InspectionStatus from, InspectionStatus to) {
  switch (to) {
    case InspectionStatus::kPending:
      return true;
    case InspectionStatus::kSyncing:
      return from == InspectionStatus::kPending || from == InspectionStatus::kFailed;
    case InspectionStatus::kFailed:
      return from == InspectionStatus::kSyncing || from == InspectionStatus::kPending || from == InspectionStatus::kFailed;
  }
  return false;
}

constexpr bool IsClaimable(InspectionStatus status) {
  return CanTransition(status, InspectionStatus::kSyncing);
}

constexpr std::string_view ToString(InspectionStatus status) {
  switch (status) {
    case InspectionStatus::kPending:
      return "pending";
    case InspectionStatus::kSyncing:
      return "syncing";
    case InspectionStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<InspectionStatus> ParseInspectionStatus(std::string_view value);

} // namespace fieldsync::model
