#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/photo_classification.hpp"

namespace fieldsync::db::model {

struct GeoTag {
  double   latitude       = 0.0;
  double   longitude      = 0.0;
  double   accuracy_m     = 0.0;
  uint64_t captured_at_ms = 0;
};

/*
  Persistent photo attachment.

  inspection_id is an owning reference that is NOT enforced by the schema:
  a photo may arrive before its inspection is saved. Orphans are swept when
  the owner is marked synced or the store is reset.
*/
struct PhotoRecord {
  std::string id;

  std::string inspection_id;

  std::vector<uint8_t> binary_payload;

  fieldsync::model::PhotoClassification classification = fieldsync::model::PhotoClassification::kOther;

  std::optional<GeoTag> geo_tag;

  uint64_t created_at_ms = 0;
};

} // namespace fieldsync::db::model
