#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using market::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "market_indexer_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    ConfigLoader::Validate(ConfigLoader::LoadFromYamlString(yaml));
  } catch (const market::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestFullDocumentLoadsFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/market/main.sqlite"
chain:
  master_address: "EQ-master"
  use_mainnet: true
  gateway_address: "127.0.0.1:50071"
  request_timeout: 5s
sync:
  interval: 120s
  fast_retry_interval: 2s
  batch_cap: 25
cache:
  rebuild_interval: 30s
force_resync:
  check_interval: 600s
  order_max_age: 3600s
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  ConfigLoader::Validate(config);

  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().sqlite().path() == "/var/lib/market/main.sqlite");
  assert(config.chain().master_address() == "EQ-master");
  assert(config.chain().use_mainnet());
  assert(config.logging().level() == "debug");

  const auto settings = ConfigLoader::Resolve(config);
  assert(settings.sync_interval == std::chrono::seconds(120));
  assert(settings.fast_retry_interval == std::chrono::seconds(2));
  assert(settings.batch_cap == 25);
  assert(settings.rebuild_interval == std::chrono::seconds(30));
  assert(settings.force_resync_interval == std::chrono::minutes(10));
  assert(!settings.admin_max_age && !settings.user_max_age);
  assert(settings.order_max_age == std::chrono::hours(1));
  assert(settings.request_timeout == std::chrono::seconds(5));
}

void TestDefaultsApplyToOmittedSections() {
  auto config = ConfigLoader::LoadFromYamlString(R"(chain:
  master_address: "EQ-master"
database:
  memory: {}
)");
  ConfigLoader::Validate(config);
  assert(config.database().has_memory());

  const auto settings = ConfigLoader::Resolve(config);
  assert(settings.sync_interval == std::chrono::minutes(5));
  assert(settings.fast_retry_interval == std::chrono::seconds(3));
  assert(settings.batch_cap == 100);
  assert(!settings.order_max_age);
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(chain:
  master_address: "12345"
)");
  assert(config.chain().master_address() == "12345");
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(chain:
  master_address: "EQ-master"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestValidationErrors() {
  assert(Rejects("chain:\n  master_address: \"  \"\n"));
  assert(Rejects("chain:\n  master_address: \"EQ\"\nsync:\n  batch_cap: 0\n"));
  assert(Rejects("chain:\n  master_address: \"EQ\"\nsync:\n  interval: 0s\n"));
  assert(Rejects("chain:\n  master_address: \"EQ\"\nforce_resync:\n  user_max_age: 0s\n"));
  assert(Rejects("chain:\n  master_address: \"EQ\"\ndatabase:\n  sqlite:\n    path: \"\"\n"));
  assert(!Rejects("chain:\n  master_address: \"EQ\"\n"));
}

} // namespace

int main() {
  TestFullDocumentLoadsFromFile();
  TestDefaultsApplyToOmittedSections();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestValidationErrors();

  std::cout << "market_indexer_unit_config_loader: pass\n";
  return 0;
}
