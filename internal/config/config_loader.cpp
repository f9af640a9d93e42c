#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace acp::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static bool LooksNumeric(const std::string& scalar) {
  // strtod also accepts hex, inf and nan; identities like 0xabc... stay strings
  if (scalar.empty()) {
    return false;
  }
  for (char c : scalar) {
    if (!((c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E')) {
      return false;
    }
  }
  return true;
}

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (LooksNumeric(scalar_value)) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

void ConfigLoader::ApplyDefaults(acp::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }
  if (config.database().backend_case() == acp::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* token = config.mutable_token();
  if (token->symbol().empty()) {
    token->set_symbol(kDefaultTokenSymbol);
  }
  if (token->decimals() == 0) {
    token->set_decimals(kDefaultTokenDecimals);
  }
  if (token->faucet_max_per_mint() == 0) {
    token->set_faucet_max_per_mint(kDefaultFaucetMax);
  }

  auto* accounts = config.mutable_accounts();
  if (accounts->tips().empty()) {
    accounts->set_tips(kDefaultTipsAccount);
  }
  if (accounts->escrow().empty()) {
    accounts->set_escrow(kDefaultEscrowAccount);
  }
  if (accounts->tips() == accounts->escrow()) {
    throw std::runtime_error("Invalid configuration: accounts.tips and accounts.escrow must differ");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

acp::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  acp::runtime::config::RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

} // namespace acp::config
