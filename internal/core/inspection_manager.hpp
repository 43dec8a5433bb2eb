#pragma once

#include <chrono>
#include <cstddef>
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
  Owns inspection records and their lifecycle.

    (absent) --Save--> pending --Claim--> syncing --MarkSynced--> (removed)
    syncing --MarkFailed / ReclaimStale--> failed --Claim--> syncing
    any --Save--> pending

  Every public call is one repository transaction.
*/
class InspectionManager {
 public:
  InspectionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<SyncQueue> queue,
                    std::shared_ptr<const util::Clock> clock);

  static std::string NewInspectionId();

  // Upsert; forces status back to pending and ensures a queue entry exists.
  void Save(const std::string& id, const std::string& payload, const std::optional<std::string>& property_id = std::nullopt);

  std::optional<db::model::InspectionRecord> Get(const std::string& id);

  std::vector<db::model::InspectionRecord> ListPending();
  std::vector<db::model::InspectionRecord> ListFailed();

  // Deletes the record, its photos and all their queue entries.
  void MarkSynced(const std::string& id);

  /*
    Finishes a delivery that uploaded the record as claimed at claimed_at_ms
    together with uploaded_photo_ids. Removes everything like MarkSynced only
    if nothing changed since the claim. A record re-saved during the upload
    is left as Save made it; a record that gained a photo goes back to
    pending. Returns true when the record was removed.
  */
  bool CompleteSync(const std::string& id, uint64_t claimed_at_ms, const std::vector<std::string>& uploaded_photo_ids);

  void MarkFailed(const std::string& id, const std::string& error_message);

  // pending|failed -> syncing. True only for the caller that performed it.
  bool Claim(const std::string& id);

  // Fails every syncing record not touched for max_age. Returns how many.
  std::size_t ReclaimStale(std::chrono::milliseconds max_age);

 private:
  std::vector<db::model::InspectionRecord> ListByStatus(model::InspectionStatus status);

  // Deletes the record, the given photos and their queue entries inside tx.
  void RemoveWithPhotos(db::Transaction& tx, const std::string& id, const std::vector<db::model::PhotoRecord>& photos);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<SyncQueue>         queue_;
  std::shared_ptr<const util::Clock> clock_;
};

} // namespace fieldsync::core
