#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using tracebrain::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "tracebrain_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejected(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\traces\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\traces\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
evaluation:
  enabled: true
  judge_model: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.evaluation().judge_model() == std::string("line1\nline2☃"));
}

void TestDefaultsAreFilled() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(llm:
  provider: LLM_PROVIDER_OLLAMA
  model: "llama3.1"
  retry_backoff: "0.25s"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.server().default_deadline().seconds() == 30);
  assert(config.query().default_limit() == 20);
  assert(config.query().max_limit() == 100);
  assert(config.ingestion().max_commit_retries() > 0);
  assert(config.llm().max_retries() > 0);
  assert(config.llm().has_timeout());
  assert(config.llm().retry_backoff().nanos() == 250000000);
  assert(!config.database().has_sqlite());
  assert(!config.evaluation().enabled());
}

void TestUnknownFieldsAreRejected() {
  assert(Rejected("unknown_field", R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");

  assert(Rejected("unknown_provider", R"(llm:
  provider: LLM_PROVIDER_PIGEON
)"));
}

void TestInconsistentSettingsAreRejected() {
  assert(Rejected("limits", R"(query:
  default_limit: 50
  max_limit: 10
)"));

  assert(Rejected("temperature", R"(llm:
  temperature: 3.5
)"));

  assert(Rejected("sqlite_path", R"(database:
  sqlite:
    wal_mode: true
)"));

  assert(Rejected("postgres_uri", R"(database:
  postgres:
    max_connections: 4
)"));
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestDefaultsAreFilled();
  TestUnknownFieldsAreRejected();
  TestInconsistentSettingsAreRejected();

  std::cout << "tracebrain_unit_config_loader: pass\n";
  return 0;
}
