#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace fieldsync::core {

class SyncQueue;

/*
  Photo attachments of an inspection.

  Photos have no lifecycle of their own: they are delivered with their owning
  inspection and removed by InspectionManager::MarkSynced or SyncQueue::Reset.
  The owner does not need to exist when a photo is saved.
*/
class AttachmentManager {
 public:
  AttachmentManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<SyncQueue> queue,
                    std::shared_ptr<const util::Clock> clock);

  // Returns the generated photo id.
  std::string Save(const std::string& inspection_id, std::vector<uint8_t> binary_payload, model::PhotoClassification classification,
                   const std::optional<db::model::GeoTag>& geo_tag = std::nullopt);

  std::vector<db::model::PhotoRecord> ListByInspection(const std::string& inspection_id);

  std::optional<std::vector<uint8_t>> GetBinaryPayload(const std::string& photo_id);

  // First photo of the inspection (created_at order) with the classification.
  std::optional<db::model::PhotoRecord> FindByClassification(const std::string& inspection_id, model::PhotoClassification classification);

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<SyncQueue>         queue_;
  std::shared_ptr<const util::Clock> clock_;
};

} // namespace fieldsync::core
