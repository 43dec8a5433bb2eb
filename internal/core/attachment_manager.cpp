#include "attachment_manager.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"
#include "store_ops.hpp"
#include "sync_queue.hpp"

namespace fieldsync::core {

AttachmentManager::AttachmentManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<SyncQueue> queue,
                                     std::shared_ptr<const util::Clock> clock)
    : repository_(std::move(repository)), queue_(std::move(queue)), clock_(std::move(clock)) {
  if (!repository_) throw std::invalid_argument("AttachmentManager requires a repository");
  if (!queue_) throw std::invalid_argument("AttachmentManager requires a sync queue");
  if (!clock_) throw std::invalid_argument("AttachmentManager requires a clock");
}

std::string AttachmentManager::Save(const std::string& inspection_id, std::vector<uint8_t> binary_payload,
                                    model::PhotoClassification classification, const std::optional<db::model::GeoTag>& geo_tag) {
  if (inspection_id.empty()) throw std::invalid_argument("inspection id must not be empty");

  db::model::PhotoRecord record;
  record.id             = util::GenerateId();
  record.inspection_id  = inspection_id;
  record.binary_payload = std::move(binary_payload);
  record.classification = classification;
  record.geo_tag        = geo_tag;
  record.created_at_ms  = clock_->NowMs();

  WithTransaction(*repository_, "save photo", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->PutPhoto(tx, record), "save photo " + record.id);
    queue_->Enqueue(tx, model::EntityType::kPhoto, record.id, model::kPhotoPriority);
  });

  FIELDSYNC_LOG_INFO("photo saved", {observability::StringField("photo_id", record.id),
                                     observability::StringField("inspection_id", inspection_id),
                                     observability::StringField("classification", model::ToString(classification)),
                                     observability::IntField("bytes", static_cast<int64_t>(record.binary_payload.size())),
                                     observability::BoolField("geo_tagged", geo_tag.has_value())});
  return record.id;
}

std::vector<db::model::PhotoRecord> AttachmentManager::ListByInspection(const std::string& inspection_id) {
  auto tx     = repository_->Begin();
  auto photos = repository_->ListPhotosByInspection(*tx, inspection_id);
  tx->Commit();
  return photos;
}

std::optional<std::vector<uint8_t>> AttachmentManager::GetBinaryPayload(const std::string& photo_id) {
  auto tx    = repository_->Begin();
  auto photo = repository_->GetPhoto(*tx, photo_id);
  tx->Commit();
  if (!photo) {
    return std::nullopt;
  }
  return std::move(photo->binary_payload);
}

std::optional<db::model::PhotoRecord> AttachmentManager::FindByClassification(const std::string&         inspection_id,
                                                                              model::PhotoClassification classification) {
  for (auto& photo : ListByInspection(inspection_id)) {
    if (photo.classification == classification) {
      return std::move(photo);
    }
  }
  return std::nullopt;
}

} // namespace fieldsync::core
