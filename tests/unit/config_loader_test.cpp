#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "depgraph_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50071"
database:
  sqlite:
    path: "/var/lib/depgraph/registry.db"
    wal_mode: true
logging:
  level: debug
  include_trace_context: false
cache:
  max_entries: 4096
graph:
  max_tree_depth: 8
observability:
  tracing_enabled: false
  metrics_enabled: false
)");

  auto config = depgraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50071");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/depgraph/registry.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(!config.cache().disabled());
  assert(config.cache().max_entries() == 4096);
  assert(config.graph().max_tree_depth() == 8);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50071"
database:
  sqlite:
    path: "C:\\depgraph\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = depgraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\depgraph\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = depgraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestQuotedNumbersStayStrings() {
  auto config = depgraph::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "1234"
logging:
  pattern: '10'
)");

  assert(config.database().sqlite().path() == "1234");
  assert(config.logging().pattern() == "10");
}

void TestPostgresBackend() {
  auto config = depgraph::config::ConfigLoader::LoadFromYamlString(R"(database:
  postgres:
    connection_uri: "postgresql://depgraph@localhost/registry"
    max_connections: 4
)");

  assert(config.database().has_postgres());
  assert(!config.database().has_sqlite());
  assert(config.database().postgres().max_connections() == 4);
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = depgraph::config::ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address().empty());
  assert(!config.has_database());
  assert(config.graph().max_tree_depth() == 0);
}

void TestTopLevelSequenceIsRejected() {
  bool threw = false;
  try {
    (void)depgraph::config::ConfigLoader::LoadFromYamlString("- server\n- database\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50071"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)depgraph::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void ExpectInvalid(const std::string& yaml, const std::string& fragment) {
  bool threw = false;
  try {
    (void)depgraph::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find(fragment) != std::string::npos;
  }
  assert(threw);
}

void TestBackendsRequireTheirLocation() {
  ExpectInvalid("database:\n  sqlite:\n    wal_mode: true\n", "database.sqlite.path");
  ExpectInvalid("database:\n  postgres:\n    max_connections: 2\n", "database.postgres.connection_uri");
}

void TestBatchSettingsNeedBatchProcessor() {
  ExpectInvalid(R"(observability:
  tracing:
    processor: TRACE_PROCESSOR_SIMPLE
    batch:
      max_queue_size: 64
)",
                "observability.tracing.batch");

  const auto config = depgraph::config::ConfigLoader::LoadFromYamlString(R"(observability:
  tracing:
    processor: TRACE_PROCESSOR_BATCH
    batch:
      max_queue_size: 64
)");
  assert(config.observability().tracing().batch().max_queue_size() == 64);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)depgraph::config::ConfigLoader::LoadFromYaml("/nonexistent/depgraph/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestInterfaceDocumentIsParsed() {
  const auto description = depgraph::config::ConfigLoader::LoadInterfaceFromJson(R"({
  "contractId": "wallet",
  "imports": [{"contractId": "math", "name": "m"}],
  "clients": [{"contractId": "oracle"}],
  "interfaces": [{"contract_id": "erc20"}]
})");

  assert(description.contract_id() == "wallet");
  assert(description.imports_size() == 1);
  assert(description.imports(0).name() == "m");
  assert(description.clients(0).contract_id() == "oracle");
  assert(description.interfaces(0).contract_id() == "erc20");
}

void TestMalformedInterfaceDocumentIsRejected() {
  bool threw = false;
  try {
    (void)depgraph::config::ConfigLoader::LoadInterfaceFromJson(R"({"contractId": "wallet", "exports": []})");
  } catch (const depgraph::util::MalformedInterface&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)depgraph::config::ConfigLoader::LoadInterfaceFromJson("{not json");
  } catch (const depgraph::util::MalformedInterface&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumbersStayStrings();
  TestPostgresBackend();
  TestEmptyDocumentYieldsDefaults();
  TestTopLevelSequenceIsRejected();
  TestUnknownFieldsAreRejected();
  TestBackendsRequireTheirLocation();
  TestBatchSettingsNeedBatchProcessor();
  TestMissingFileIsReported();
  TestInterfaceDocumentIsParsed();
  TestMalformedInterfaceDocumentIsRejected();

  std::cout << "depgraph_unit_config_loader: pass\n";
  return 0;
}
