#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "foreman_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/foreman/history.db"
workers:
  executable: /opt/claude/bin/claude
  model: sonnet
  api_key_mode: allowed
  output_buffer_size: 50
  extra_args: ["--add-dir", "/tmp"]
  stop_grace_ms: 500
pipeline:
  default_max_iterations: 4
  step_timeout_ms: 600000
  skip_skill_synthesis: true
persistence:
  queue_workers: 2
)");

  auto config = foreman::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/foreman/history.db");
  assert(config.workers().executable() == "/opt/claude/bin/claude");
  assert(config.workers().model() == "sonnet");
  assert(config.workers().api_key_mode() == "allowed");
  assert(config.workers().output_buffer_size() == 50);
  assert(config.workers().extra_args_size() == 2);
  assert(config.workers().extra_args(1) == "/tmp");
  assert(config.workers().stop_grace_ms() == 500);
  assert(config.pipeline().default_max_iterations() == 4);
  assert(config.pipeline().step_timeout_ms() == 600000);
  assert(config.pipeline().skip_skill_synthesis());
  assert(config.persistence().queue_workers() == 2);
}

void TestDefaultsAreApplied() {
  auto config = foreman::config::ConfigLoader::LoadFromString("logging:\n  level: info\n");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.workers().output_buffer_size() == 500);
  assert(config.workers().stop_grace_ms() == 2000);
  assert(config.workers().api_key_mode() == "blocked");
  assert(config.pipeline().default_max_iterations() == 3);
  assert(config.persistence().queue_workers() == 1);
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = foreman::config::ConfigLoader::LoadFromString("");
  assert(config.server().bind_address() == "0.0.0.0:50061");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\foreman\\\"quoted\"\\db.sqlite"
)");

  auto config = foreman::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\foreman\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = foreman::config::ConfigLoader::LoadFromString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)foreman::config::ConfigLoader::LoadFromString(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestSqliteWithoutPathIsRejected() {
  bool threw = false;
  try {
    (void)foreman::config::ConfigLoader::LoadFromString("database:\n  sqlite: {}\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)foreman::config::ConfigLoader::LoadFromYaml("/nonexistent/foreman/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestDefaultsAreApplied();
  TestEmptyDocumentYieldsDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestSqliteWithoutPathIsRejected();
  TestMissingFileIsReported();

  std::cout << "foreman_unit_config_loader: pass\n";
  return 0;
}
