#pragma once

#include "agrovest/lifecycle/investment_lifecycle.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace agrovest {

enum class GatewayMode { Paystack, Mock };

const char* toString(GatewayMode mode);

struct GatewayConfig {
  GatewayMode mode{GatewayMode::Mock};
  std::string base_url{"https://api.paystack.co"};
  // Also the webhook signing secret.
  std::string secret_key;
  std::string callback_url;
  long timeout_ms{10000};
};

struct IpcConfig {
  // An empty endpoint disables the IPC server (tests call executeCommand()
  // directly).
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
  // Threads running commands; a slow gateway call holds only one.
  int command_workers{4};
};

struct StoreConfig {
  long lock_timeout_ms{250};
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Every tunable of the engine, with defaults.
//
// @details
// JSON layout (all sections and keys optional):
//
//   {
//     "gateway":   {"mode": "paystack"|"mock", "base_url": "...",
//                   "secret_key": "...", "callback_url": "...",
//                   "timeout_ms": 10000},
//     "ipc":       {"cmd_endpoint": "...", "pub_endpoint": "...",
//                   "command_workers": 4},
//     "store":     {"lock_timeout_ms": 250},
//     "lifecycle": {"purge_cancelled_on_cancel": true}
//   }
//
// PAYSTACK_SECRET_KEY in the environment overrides gateway.secret_key.
// -----------------------------------------------------------------------------
struct EngineConfig {
  GatewayConfig gateway;
  IpcConfig ipc;
  StoreConfig store;
  LifecycleOptions lifecycle;

  // Reads the file, applies fromJson() and the environment override, then
  // validate(). Throws EngineError(Validation) on any problem.
  static EngineConfig loadFromFile(const std::string& path);

  static EngineConfig fromJson(const nlohmann::json& j);

  void applyEnvironment();

  // paystack mode needs a secret; timeouts must be positive.
  void validate() const;
};

}  // namespace agrovest
