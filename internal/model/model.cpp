#include "internal/model/inspection_status.hpp"
#include "internal/model/photo_classification.hpp"

namespace fieldsync::model {

std::optional<InspectionStatus> ParseInspectionStatus(std::string_view value) {
  for (auto status : {InspectionStatus::kPending, InspectionStatus::kSyncing, InspectionStatus::kFailed}) {
    if (ToString(status) == value) return status;
  }
  return std::nullopt;
}

std::optional<PhotoClassification> ParsePhotoClassification(std::string_view value) {
  for (auto classification :
       {PhotoClassification::kPressure, PhotoClassification::kCondition, PhotoClassification::kDataplate, PhotoClassification::kOther}) {
    if (ToString(classification) == value) return classification;
  }
  return std::nullopt;
}

} // namespace fieldsync::model
