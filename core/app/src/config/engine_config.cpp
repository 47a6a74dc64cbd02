#include "agrovest/config/engine_config.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace agrovest {

const char* toString(GatewayMode mode) {
  switch (mode) {
    case GatewayMode::Paystack: return "paystack";
    case GatewayMode::Mock:     return "mock";
  }
  return "unknown";
}

EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
  EngineConfig config;

  try {
    if (j.contains("gateway")) {
      const auto& g = j.at("gateway");
      const std::string mode = g.value("mode", std::string("mock"));
      if (mode == "paystack") {
        config.gateway.mode = GatewayMode::Paystack;
      } else if (mode == "mock") {
        config.gateway.mode = GatewayMode::Mock;
      } else {
        throw EngineError(ErrorCode::Validation,
                          "Unknown gateway mode '" + mode + "'");
      }
      config.gateway.base_url = g.value("base_url", config.gateway.base_url);
      config.gateway.secret_key =
          g.value("secret_key", config.gateway.secret_key);
      config.gateway.callback_url =
          g.value("callback_url", config.gateway.callback_url);
      config.gateway.timeout_ms =
          g.value("timeout_ms", config.gateway.timeout_ms);
    }

    if (j.contains("ipc")) {
      const auto& i = j.at("ipc");
      config.ipc.cmd_endpoint = i.value("cmd_endpoint", config.ipc.cmd_endpoint);
      config.ipc.pub_endpoint = i.value("pub_endpoint", config.ipc.pub_endpoint);
      config.ipc.command_workers =
          i.value("command_workers", config.ipc.command_workers);
    }

    if (j.contains("store")) {
      config.store.lock_timeout_ms =
          j.at("store").value("lock_timeout_ms", config.store.lock_timeout_ms);
    }

    if (j.contains("lifecycle")) {
      config.lifecycle.purge_cancelled_on_cancel =
          j.at("lifecycle")
              .value("purge_cancelled_on_cancel",
                     config.lifecycle.purge_cancelled_on_cancel);
    }
  } catch (const nlohmann::json::exception& e) {
    throw EngineError(ErrorCode::Validation,
                      std::string("Invalid configuration: ") + e.what());
  }

  return config;
}

void EngineConfig::applyEnvironment() {
  if (const char* secret = std::getenv("PAYSTACK_SECRET_KEY")) {
    if (*secret != '\0') {
      gateway.secret_key = secret;
    }
  }
}

void EngineConfig::validate() const {
  if (gateway.mode == GatewayMode::Paystack && gateway.secret_key.empty()) {
    throw EngineError(ErrorCode::Validation,
                      "gateway.secret_key (or PAYSTACK_SECRET_KEY) is required "
                      "in paystack mode");
  }
  if (gateway.timeout_ms <= 0) {
    throw EngineError(ErrorCode::Validation,
                      "gateway.timeout_ms must be positive");
  }
  if (store.lock_timeout_ms <= 0) {
    throw EngineError(ErrorCode::Validation,
                      "store.lock_timeout_ms must be positive");
  }
  if (ipc.command_workers < 1) {
    throw EngineError(ErrorCode::Validation,
                      "ipc.command_workers must be at least 1");
  }
}

EngineConfig EngineConfig::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw EngineError(ErrorCode::Validation,
                      "Cannot open configuration file " + path);
  }

  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception& e) {
    throw EngineError(ErrorCode::Validation,
                      "Malformed configuration file " + path + ": " + e.what());
  }

  EngineConfig config = fromJson(j);
  config.applyEnvironment();
  config.validate();

  std::cout << "[EngineConfig] loaded " << path
            << " gateway=" << toString(config.gateway.mode)
            << " cmd=" << config.ipc.cmd_endpoint
            << " pub=" << config.ipc.pub_endpoint << "\n";
  return config;
}

}  // namespace agrovest
