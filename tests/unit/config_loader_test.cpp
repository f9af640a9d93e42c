#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "acp_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\acp\\\"quoted\"\\ledger.db"
    wal_mode: true
)");

  auto config = acp::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\acp\\\"quoted\"\\ledger.db");
  assert(config.database().sqlite().wal_mode());
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:7000"
database:
  memory: {}
logging:
  level: debug
  log_events: true
token:
  symbol: TEST
  decimals: 2
  faucet_enabled: true
  faucet_max_per_mint: 50
accounts:
  tips: "0x1111111111111111111111111111111111111111"
  escrow: "0x2222222222222222222222222222222222222222"
)");

  auto config = acp::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:7000");
  assert(config.database().has_memory());
  assert(config.logging().level() == "debug");
  assert(config.logging().log_events());
  assert(config.token().symbol() == "TEST");
  assert(config.token().decimals() == 2);
  assert(config.token().faucet_enabled());
  assert(config.token().faucet_max_per_mint() == 50);
  // hex-looking identities must stay strings
  assert(config.accounts().tips() == "0x1111111111111111111111111111111111111111");
  assert(config.accounts().escrow() == "0x2222222222222222222222222222222222222222");
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = acp::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == acp::config::kDefaultBindAddress);
  assert(config.database().has_memory());
  assert(config.token().symbol() == "USDC");
  assert(config.token().decimals() == 6);
  assert(!config.token().faucet_enabled());
  assert(config.token().faucet_max_per_mint() == 10000);
  assert(config.accounts().tips() == "acp:tips");
  assert(config.accounts().escrow() == "acp:escrow");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)acp::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestIdenticalLedgerAccountsAreRejected() {
  const auto yaml_path = WriteYaml("same_accounts",
                                   R"(accounts:
  tips: "acp:pool"
  escrow: "acp:pool"
)");

  bool threw = false;
  try {
    (void)acp::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)acp::config::ConfigLoader::LoadFromYaml("/nonexistent/acp-ledger.yaml");
  } catch (const std::runtime_error& ex) {
    threw = std::string(ex.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestFullConfigIsParsed();
  TestEmptyDocumentYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestIdenticalLedgerAccountsAreRejected();
  TestMissingFileIsReported();

  std::cout << "acp_unit_config_loader: pass\n";
  return 0;
}
