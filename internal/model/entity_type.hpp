#pragma once

#include <cstdint>
#include <string_view>

namespace fieldsync::model {

enum class EntityType : std::uint8_t {
  kInspection = 0,
  kPhoto      = 1,
};

// Lower value drains first. Inspections must reach the remote side before
// any photo that references them.
constexpr int kInspectionPriority = 1;
constexpr int kPhotoPriority      = 2;

constexpr int DefaultPriority(EntityType type) {
  return type == EntityType::kInspection ? kInspectionPriority : kPhotoPriority;
}

constexpr std::string_view ToString(EntityType type) {
  return type == EntityType::kInspection ? "inspection" : "photo";
}

// Queue entry ids are "<prefix><entity id>" so that enqueue is idempotent.
constexpr std::string_view QueueIdPrefix(EntityType type) {
  return type == EntityType::kInspection ? "insp-" : "photo-";
}

} // namespace fieldsync::model
