#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using ledger::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "resource_ledger_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(ledger:
  max_memory_mb: 64
  idle_threshold_ms: 120000
  protected_tier: 3
  sweep_interval_ms: 5000
  defragment_threshold: 0.25
compaction:
  enabled: false
  fragmentation_trigger: 0.4
logging:
  level: debug
  pattern: "%v"
metrics:
  enabled: true
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_HTTP
  collection_interval_ms: 1000
soak:
  iterations: 10
  tick_ms: 1
  batch_bytes: 4096
  batch_lifetime_ticks: 3
  seed: 9
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.ledger().max_memory_mb() == 64);
  assert(config.ledger().idle_threshold_ms() == 120000);
  assert(config.ledger().has_protected_tier() && config.ledger().protected_tier() == 3);
  assert(config.ledger().sweep_interval_ms() == 5000);
  assert(config.ledger().defragment_threshold() == 0.25);
  assert(config.compaction().has_enabled() && !config.compaction().enabled());
  assert(config.compaction().fragmentation_trigger() == 0.4);
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");
  assert(config.metrics().enabled());
  assert(config.metrics().otlp_endpoint() == "localhost:4317");
  assert(config.metrics().transport() == ledger::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.soak().batch_bytes() == 4096);
  assert(config.soak().seed() == 9);
}

void TestEmptyDocumentYieldsDefaults() {
  const auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.ledger().max_budget_bytes() == 0);
  assert(!config.ledger().has_protected_tier());
  assert(!config.compaction().has_enabled());
  assert(config.logging().level().empty());
}

void TestQuotedNumbersStayStrings() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "123"
)");
  assert(config.logging().pattern() == "123");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(ledger:
  max_memory_mb: 64
  unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestOutOfRangeValuesAreRejected() {
  assert(Rejects("ledger:\n  defragment_threshold: 1.5\n"));
  assert(Rejects("compaction:\n  fragmentation_trigger: -0.1\n"));
  assert(Rejects("logging:\n  level: verbose\n"));
  assert(Rejects("ledger:\n  max_memory_mb: 17592186044416\n"));
  assert(Rejects("- not\n- a\n- mapping\n"));
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/resource-ledger.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyDocumentYieldsDefaults();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "ledger_unit_config_loader: pass\n";
  return 0;
}
