#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/inspection_status.hpp"

namespace fieldsync::db::model {

/*
  Persistent inspection row.

  IMPORTANT:
  - payload is opaque structured data (JSON text); the store never parses it.
  - retry_count and created_at_ms survive re-saves of the same id.
  - error_message is only set while status == kFailed.
*/

struct InspectionRecord {
  std::string id;

  std::string payload;

  std::optional<std::string> property_id;

  fieldsync::model::InspectionStatus status = fieldsync::model::InspectionStatus::kPending;

  uint32_t retry_count = 0;

  // epoch ms
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  std::optional<std::string> error_message;
};

} // namespace fieldsync::db::model
