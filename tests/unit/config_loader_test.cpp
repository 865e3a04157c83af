#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using projsync::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "projsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool RejectsYaml(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const projsync::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestFullConfigLoadsFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "/tmp/projsync.db"
    wal_mode: true
    busy_timeout: "0.250s"
sync:
  mode: "summary-table"
  staleness_window: "2s"
  retry_limit: 5
  self_heal: true
  workers: 8
  upsert_deadline: "1.500s"
  retry_backoff_initial: "0.050s"
  retry_backoff_max: "2s"
monitor:
  sweep_interval: "30s"
  batch_size: 128
derivation:
  input_column: "FreeGHz"
  output_column: "FreeCores"
  divisor: 2.4
summary:
  tombstone_retention: "3600s"
logging:
  level: "debug"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/projsync.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout().nanos() == 250000000);
  assert(config.sync().mode() == "summary-table");
  assert(config.sync().staleness_window().seconds() == 2);
  assert(config.sync().has_retry_limit());
  assert(config.sync().retry_limit() == 5);
  assert(config.sync().self_heal());
  assert(config.sync().workers() == 8);
  assert(config.sync().upsert_deadline().seconds() == 1);
  assert(config.sync().upsert_deadline().nanos() == 500000000);
  assert(config.monitor().batch_size() == 128);
  assert(config.derivation().divisor() == 2.4);
  assert(config.summary().tombstone_retention().seconds() == 3600);
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\projsync\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\projsync\\\"quoted\"\\db.sqlite");
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.sync().mode().empty());
  assert(!config.sync().has_retry_limit());
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
}

void TestUnknownFieldsAreRejected() {
  assert(RejectsYaml(R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)"));
}

void TestInvalidModeIsRejected() {
  assert(RejectsYaml("sync:\n  mode: \"materialized\"\n"));
}

void TestBackoffMaxBelowInitialIsRejected() {
  assert(RejectsYaml(R"(sync:
  retry_backoff_initial: "2s"
  retry_backoff_max: "1s"
)"));
}

void TestNonPositiveDivisorIsRejected() {
  assert(RejectsYaml("derivation:\n  divisor: -2.4\n"));
}

void TestOutputColumnMustDifferFromInput() {
  assert(RejectsYaml(R"(derivation:
  input_column: "FreeGHz"
  output_column: "FreeGHz"
)"));
}

void TestSqliteWithoutPathIsRejected() {
  assert(RejectsYaml(R"(database:
  sqlite:
    wal_mode: true
)"));
}

void TestNegativeBusyTimeoutIsRejected() {
  assert(RejectsYaml(R"(database:
  sqlite:
    path: "/tmp/projsync.db"
    busy_timeout: "-1s"
)"));
}

void TestUnknownLogLevelIsRejected() {
  assert(RejectsYaml("logging:\n  level: \"loud\"\n"));
  assert(RejectsYaml("logging:\n  drift_level: \"loud\"\n"));
}

void TestMissingFileThrows() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/projsync/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigLoadsFromFile();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestInvalidModeIsRejected();
  TestBackoffMaxBelowInitialIsRejected();
  TestNonPositiveDivisorIsRejected();
  TestOutputColumnMustDifferFromInput();
  TestSqliteWithoutPathIsRejected();
  TestNegativeBusyTimeoutIsRejected();
  TestUnknownLogLevelIsRejected();
  TestMissingFileThrows();

  std::cout << "projsync_unit_config_loader: pass\n";
  return 0;
}
