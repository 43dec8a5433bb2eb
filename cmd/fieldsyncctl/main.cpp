#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using fieldsync::db::model::InspectionRecord;
using fieldsync::db::model::PhotoRecord;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fieldsyncctl --config <file.yaml> save-inspection <id|-> <payload-file> [property-id]\n"
            << "  fieldsyncctl --config <file.yaml> save-photo <inspection-id> <pressure|condition|dataplate|other> <file> [lat lon accuracy]\n"
            << "  fieldsyncctl --config <file.yaml> get <id>\n"
            << "  fieldsyncctl --config <file.yaml> pending\n"
            << "  fieldsyncctl --config <file.yaml> failed\n"
            << "  fieldsyncctl --config <file.yaml> photos <inspection-id>\n"
            << "  fieldsyncctl --config <file.yaml> queue\n"
            << "  fieldsyncctl --config <file.yaml> count\n"
            << "  fieldsyncctl --config <file.yaml> claim <id>\n"
            << "  fieldsyncctl --config <file.yaml> mark-synced <id>\n"
            << "  fieldsyncctl --config <file.yaml> mark-failed <id> <message>\n"
            << "  fieldsyncctl --config <file.yaml> reclaim [max-age-ms]\n"
            << "  fieldsyncctl --config <file.yaml> reset\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot read " + path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void PrintInspection(const InspectionRecord& record) {
  std::cout << "id=" << record.id << " status=" << fieldsync::model::ToString(record.status) << " retry_count=" << record.retry_count
            << " created_at_ms=" << record.created_at_ms << " updated_at_ms=" << record.updated_at_ms;
  if (record.property_id) std::cout << " property_id=" << *record.property_id;
  if (record.error_message) std::cout << " error=\"" << *record.error_message << "\"";
  std::cout << "\n";
}

static void PrintPhoto(const PhotoRecord& photo) {
  std::cout << "id=" << photo.id << " inspection_id=" << photo.inspection_id
            << " classification=" << fieldsync::model::ToString(photo.classification) << " bytes=" << photo.binary_payload.size();
  if (photo.geo_tag) {
    std::cout << " lat=" << photo.geo_tag->latitude << " lon=" << photo.geo_tag->longitude << " accuracy_m=" << photo.geo_tag->accuracy_m;
  }
  std::cout << "\n";
}

static int Run(fieldsync::factory::Application& app, const std::vector<std::string>& args) {
  const auto& cmd = args[0];

  // ------------------------------------------------------------

  if (cmd == "save-inspection") {
    if (args.size() < 3) return 1;

    const auto id      = args[1] == "-" ? fieldsync::core::InspectionManager::NewInspectionId() : args[1];
    const auto payload = ReadFile(args[2]);

    std::optional<std::string> property_id;
    if (args.size() >= 4) property_id = args[3];

    app.inspections->Save(id, payload, property_id);
    std::cout << id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "save-photo") {
    if (args.size() < 4) return 1;

    const auto classification = fieldsync::model::ParsePhotoClassification(args[2]);
    if (!classification) {
      std::cerr << "unsupported classification: " << args[2] << "\n";
      return 1;
    }

    const auto           bytes = ReadFile(args[3]);
    std::vector<uint8_t> payload(bytes.begin(), bytes.end());

    std::optional<fieldsync::db::model::GeoTag> geo_tag;
    if (args.size() >= 7) {
      fieldsync::db::model::GeoTag tag;
      tag.latitude       = std::stod(args[4]);
      tag.longitude      = std::stod(args[5]);
      tag.accuracy_m     = std::stod(args[6]);
      tag.captured_at_ms = app.clock->NowMs();
      geo_tag            = tag;
    }

    std::cout << app.attachments->Save(args[1], std::move(payload), *classification, geo_tag) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (args.size() < 2) return 1;

    auto record = app.inspections->Get(args[1]);
    if (!record) {
      std::cerr << "not found: " << args[1] << "\n";
      return 2;
    }
    PrintInspection(*record);
    std::cout << record->payload << "\n";
    return 0;
  }

  if (cmd == "pending" || cmd == "failed") {
    const auto records = cmd == "pending" ? app.inspections->ListPending() : app.inspections->ListFailed();
    for (const auto& record : records) PrintInspection(record);
    return 0;
  }

  if (cmd == "photos") {
    if (args.size() < 2) return 1;

    for (const auto& photo : app.attachments->ListByInspection(args[1])) PrintPhoto(photo);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "queue") {
    for (const auto& entry : app.queue->Drain()) {
      std::cout << entry.id << " type=" << fieldsync::model::ToString(entry.entity_type) << " priority=" << entry.priority
                << " enqueued_at_ms=" << entry.enqueued_at_ms << "\n";
    }
    return 0;
  }

  if (cmd == "count") {
    std::cout << app.queue->Count() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "claim") {
    if (args.size() < 2) return 1;

    const bool claimed = app.inspections->Claim(args[1]);
    std::cout << (claimed ? "claimed" : "not claimed") << "\n";
    return claimed ? 0 : 3;
  }

  if (cmd == "mark-synced") {
    if (args.size() < 2) return 1;

    app.inspections->MarkSynced(args[1]);
    std::cout << "synced\n";
    return 0;
  }

  if (cmd == "mark-failed") {
    if (args.size() < 3) return 1;

    app.inspections->MarkFailed(args[1], args[2]);
    std::cout << "failed\n";
    return 0;
  }

  if (cmd == "reclaim") {
    auto max_age = app.sync_options.stale_claim_after.value_or(std::chrono::minutes(10));
    if (args.size() >= 2) max_age = std::chrono::milliseconds(std::stoll(args[1]));

    std::cout << "reclaimed=" << app.inspections->ReclaimStale(max_age) << "\n";
    return 0;
  }

  if (cmd == "reset") {
    app.queue->Reset();
    std::cout << "reset\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = fieldsync::config::ConfigLoader::LoadFromYaml(config_path);
    fieldsync::observability::InitializeLogging(config);

    auto app = fieldsync::factory::Build(config);

    const int rc = Run(app, args);
    if (rc == 1) Usage();

    app.repository->Close();
    fieldsync::observability::ShutdownLogging();
    return rc;
  } catch (const fieldsync::util::StorageError& e) {
    FIELDSYNC_LOG_ERROR("storage failure", {fieldsync::observability::StringField("error", e.what())});
    fieldsync::observability::ShutdownLogging();
    return 4;
  } catch (const std::exception& e) {
    FIELDSYNC_LOG_ERROR("fatal error", {fieldsync::observability::StringField("error", e.what())});
    fieldsync::observability::ShutdownLogging();
    return 2;
  }
}
