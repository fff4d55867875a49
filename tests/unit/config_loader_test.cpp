#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using demonlist::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "demonlist_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
database:
  sqlite:
    path: "C:\\lists\\\"quoted\"\\demonlist.sqlite"
  max_connections: 4
  acquire_timeout_ms: 250
workers:
  threads: 2
list:
  list_size: 50
  extended_list_size: 100
pagination:
  default_limit: 25
  max_limit: 75
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\lists\\\"quoted\"\\demonlist.sqlite");
  assert(config.database().max_connections() == 4);
  assert(config.database().acquire_timeout_ms() == 250);
  assert(config.workers().threads() == 2);
  assert(config.list().list_size() == 50);
  assert(config.list().extended_list_size() == 100);
  assert(config.pagination().default_limit() == 25);
  assert(config.pagination().max_limit() == 75);
}

void TestDefaultsFillEmptySections() {
  auto config = ConfigLoader::LoadFromString("workers:\n  threads: 3\n");
  assert(config.database().has_memory());
  assert(config.database().max_connections() == 16);
  assert(config.database().acquire_timeout_ms() == 0);
  assert(config.workers().threads() == 3);
  assert(config.list().list_size() == 75);
  assert(config.list().extended_list_size() == 150);
  assert(config.pagination().default_limit() == 50);
  assert(config.pagination().max_limit() == 100);

  auto empty = ConfigLoader::LoadFromString("");
  assert(empty.database().has_memory());
  assert(empty.workers().threads() == 4);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(database:
  postgres:
    connection_uri: "12345"
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "12345");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Rejects("workers:\n  threads: 1\n  priority: high\n"));
}

void TestInconsistentValuesAreRejected() {
  assert(Rejects("list:\n  list_size: 200\n  extended_list_size: 100\n"));
  assert(Rejects("pagination:\n  default_limit: 500\n"));
  assert(Rejects("- just\n- a\n- list\n"));
  assert(Rejects("workers: [unclosed\n"));

  bool missing_file = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/demonlist.yaml");
  } catch (const std::runtime_error&) {
    missing_file = true;
  }
  assert(missing_file);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsFillEmptySections();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestInconsistentValuesAreRejected();

  std::cout << "demonlist_unit_config_loader: pass\n";
  return 0;
}
