#include "internal/config/config_loader.hpp"

#include <google/protobuf/util/time_util.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using google::protobuf::util::TimeUtil;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fieldsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullSqliteConfig() {
  const auto yaml_path = WriteYaml("full_sqlite",
                                   R"(database:
  sqlite:
    path: /var/lib/fieldsync/store.db
    wal_mode: true
    synchronous: FULL
    busy_timeout_ms: 2500
logging:
  level: debug
  pattern: "[%l] %v"
sync:
  max_retries: 5
  base_backoff: 2s
  max_backoff: 300s
  stale_claim_after: 90s
)");

  auto config = fieldsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/fieldsync/store.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().synchronous() == "FULL");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.sync().max_retries() == 5);
  assert(TimeUtil::DurationToMilliseconds(config.sync().base_backoff()) == 2000);
  assert(TimeUtil::DurationToMilliseconds(config.sync().max_backoff()) == 300000);
  assert(TimeUtil::DurationToMilliseconds(config.sync().stale_claim_after()) == 90000);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\fieldsync\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = fieldsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\fieldsync\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  auto config = fieldsync::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "2024"
)");
  assert(config.database().sqlite().path() == "2024");
}

void TestMemoryAndEmptyDocuments() {
  auto memory = fieldsync::config::ConfigLoader::LoadFromYamlString("database:\n  memory: {}\n");
  assert(memory.database().has_memory());
  assert(!memory.database().has_sqlite());

  auto empty = fieldsync::config::ConfigLoader::LoadFromYamlString("");
  assert(!empty.has_database());
  assert(!empty.has_sync());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)fieldsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMalformedInputIsRejected() {
  bool threw = false;
  try {
    (void)fieldsync::config::ConfigLoader::LoadFromYamlString("- just\n- a list\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)fieldsync::config::ConfigLoader::LoadFromYaml("/nonexistent/fieldsync.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)fieldsync::config::ConfigLoader::LoadFromYamlString("sync:\n  base_backoff: soon\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullSqliteConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestMemoryAndEmptyDocuments();
  TestUnknownFieldsAreRejected();
  TestMalformedInputIsRejected();

  std::cout << "fieldsync_unit_config_loader: pass\n";
  return 0;
}
