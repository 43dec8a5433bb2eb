#pragma once

#include <atomic>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace fieldsync::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and by `database: memory` configs.
  Nothing survives the process.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  void Open() override;
  void Close() override;
  bool IsOpen() const override;

  std::unique_ptr<Transaction> Begin() override;

  Result PutInspection(Transaction&, const model::InspectionRecord&) override;
  std::optional<model::InspectionRecord> GetInspection(Transaction&, const std::string&) override;
  std::vector<model::InspectionRecord> ListInspectionsByStatus(Transaction&, fieldsync::model::InspectionStatus) override;
  Result DeleteInspection(Transaction&, const std::string&) override;
  uint64_t CountInspections(Transaction&) override;
  Result ClearInspections(Transaction&) override;

  Result PutPhoto(Transaction&, const model::PhotoRecord&) override;
  std::optional<model::PhotoRecord> GetPhoto(Transaction&, const std::string&) override;
  std::vector<model::PhotoRecord> ListPhotosByInspection(Transaction&, const std::string&) override;
  Result DeletePhoto(Transaction&, const std::string&) override;
  uint64_t CountPhotos(Transaction&) override;
  Result ClearPhotos(Transaction&) override;

  Result InsertQueueEntry(Transaction&, model::QueueEntryRecord&) override;
  std::optional<model::QueueEntryRecord> GetQueueEntry(Transaction&, const std::string&) override;
  std::vector<model::QueueEntryRecord> ListQueueEntries(Transaction&) override;
  Result DeleteQueueEntry(Transaction&, const std::string&) override;
  uint64_t CountQueueEntries(Transaction&) override;
  Result ClearQueueEntries(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::InspectionRecord> inspections;
    std::unordered_map<std::string, model::PhotoRecord> photos;
    std::unordered_map<std::string, model::QueueEntryRecord> queue;
    uint64_t next_sequence = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
  std::atomic<bool> open_{false};
};

}
