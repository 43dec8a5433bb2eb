#pragma once

#include <cstdint>
#include <string>

#include "internal/model/entity_type.hpp"

namespace fieldsync::db::model {

/*
  One outstanding delivery.

  id is derived from the referenced entity (see model::QueueIdPrefix), so the
  queue can never hold two entries for the same inspection or photo.
  sequence is assigned by the repository on insert and only breaks ties
  between entries with equal (priority, enqueued_at_ms).
*/
struct QueueEntryRecord {
  std::string id;

  fieldsync::model::EntityType entity_type = fieldsync::model::EntityType::kInspection;

  std::string reference_id;

  int priority = fieldsync::model::kInspectionPriority;

  uint64_t enqueued_at_ms = 0;

  uint64_t sequence = 0;
};

} // namespace fieldsync::db::model
