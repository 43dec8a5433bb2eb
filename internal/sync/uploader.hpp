#pragma once

#include <vector>

#include "internal/db/model/inspection_record.hpp"
#include "internal/db/model/photo_record.hpp"

namespace fieldsync::sync {

/*
  Remote delivery of one inspection with its photos.

  Implementations throw on any failure; the exception message is recorded on
  the inspection via MarkFailed. Returning normally means the remote side
  accepted everything and the local copy may be deleted.
*/
class Uploader {
 public:
  virtual ~Uploader() = default;

  virtual void UploadInspection(const db::model::InspectionRecord& record, const std::vector<db::model::PhotoRecord>& photos) = 0;
};

} // namespace fieldsync::sync
