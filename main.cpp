// -----------------------------------------------------------------------------
// agrovest_engine: single executable entry point.
//
//   1) Load EngineConfig from argv[1] (defaults when no path is given).
//   2) Create the live clock and the payment gateway the config selects
//      (PaystackGateway over libcurl, or the scripted MockPaymentGateway).
//   3) Create and start the InvestmentEngine. It serves JSON commands on
//      the IPC REP socket and broadcasts committed changes on the PUB
//      socket.
//   4) Sleep on the main thread until SIGINT/SIGTERM, then stop cleanly.
//
// Thread layout:
//   main thread   -> waits for the shutdown flag
//   ipc thread    -> IpcServer (commands run here)
//   audit thread  -> post-commit subscribers (console, telemetry bridge)
// -----------------------------------------------------------------------------

#include "agrovest/config/engine_config.hpp"
#include "agrovest/engine/investment_engine.hpp"
#include "agrovest/errors/engine_error.hpp"
#include "agrovest/payment/mock_payment_gateway.hpp"
#include "agrovest/payment/paystack_gateway.hpp"
#include "agrovest/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace {

// Set from the signal handler; polled by main().
std::atomic<bool> g_shutdown_requested{false};

void shutdown_handler(int /*signum*/) { g_shutdown_requested.store(true); }

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  agrovest::EngineConfig config;
  try {
    if (argc > 1) {
      config = agrovest::EngineConfig::loadFromFile(argv[1]);
    } else {
      config.applyEnvironment();
      config.validate();
      std::cout << "[main] no config file given, using defaults.\n";
    }
  } catch (const agrovest::EngineError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock and gateway.
  // -------------------------------------------------------------------------
  agrovest::LiveTimeProvider clock;

  std::unique_ptr<agrovest::IPaymentGateway> gateway;
  if (config.gateway.mode == agrovest::GatewayMode::Paystack) {
    agrovest::PaystackSettings settings;
    settings.base_url = config.gateway.base_url;
    settings.secret_key = config.gateway.secret_key;
    settings.callback_url = config.gateway.callback_url;
    settings.timeout_ms = config.gateway.timeout_ms;
    gateway = std::make_unique<agrovest::PaystackGateway>(settings);
  } else {
    gateway = std::make_unique<agrovest::MockPaymentGateway>();
  }

  // -------------------------------------------------------------------------
  // 3) Engine.
  // -------------------------------------------------------------------------
  agrovest::InvestmentEngine engine(config, clock, *gateway);
  try {
    engine.start();
  } catch (const std::exception& e) {
    // Typically an endpoint already bound by another process.
    std::cerr << "[main] ERROR: engine failed to start: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] listening on " << config.ipc.cmd_endpoint
            << ". Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait, then shut down.
  // -------------------------------------------------------------------------
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "[main] shutdown requested. Stopping engine...\n";
  engine.stop();
  return 0;
}
