#pragma once

#include "agrovest/concurrent/event_loop_thread.hpp"
#include "agrovest/config/engine_config.hpp"
#include "agrovest/inventory/inventory_allocator.hpp"
#include "agrovest/ledger/ledger.hpp"
#include "agrovest/lifecycle/investment_lifecycle.hpp"
#include "agrovest/lifecycle/payment_reconciler.hpp"
#include "agrovest/network/ipc_server.hpp"
#include "agrovest/payment/i_payment_gateway.hpp"
#include "agrovest/payment/payment_adapter.hpp"
#include "agrovest/store/store.hpp"
#include "agrovest/time/i_time_provider.hpp"
#include "agrovest/withdrawal/withdrawal_processor.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace agrovest {

// -----------------------------------------------------------------------------
// InvestmentEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every component and exposes them through one JSON command
//         entry point.
//
// @details
// Wiring (all constructed in the constructor, in dependency order):
//
//   Store <- InventoryAllocator, Ledger
//   IPaymentGateway -> PaymentAdapter (signer = gateway secret)
//   InvestmentLifecycle(Store, Allocator, Ledger, Adapter, clock, sink)
//   PaymentReconciler(Store, Adapter, Lifecycle)
//   WithdrawalProcessor(Store, Ledger, clock, sink)
//
// The EventSink handed to the components pushes committed-change events
// onto the audit EventLoopThread. Its bus feeds the console reconciliation
// log and, once start() brings it up, the IpcServer PUB socket.
//
// executeCommand() maps EngineError codes onto HTTP-style "code" values so
// IPC clients can treat replies like REST responses.
//
// Thread model:
//   Request threads (the IPC worker, or tests calling executeCommand()
//   directly) run the components concurrently; the Store provides the
//   isolation. The audit loop is the only thread that runs subscribers.
//
// Ownership:
//   Borrows the clock and the gateway; they must outlive the engine.
// -----------------------------------------------------------------------------
class InvestmentEngine {
 public:
  InvestmentEngine(EngineConfig config, const ITimeProvider& clock,
                   IPaymentGateway& gateway);

  ~InvestmentEngine();

  InvestmentEngine(const InvestmentEngine&) = delete;
  InvestmentEngine& operator=(const InvestmentEngine&) = delete;
  InvestmentEngine(InvestmentEngine&&) = delete;
  InvestmentEngine& operator=(InvestmentEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // 1. Starts the audit loop.
  // 2. If both IPC endpoints are set, starts the IpcServer and bridges the
  //    audit bus to its telemetry queue.
  // Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Stops IPC first (no new commands), then drains and joins the audit loop.
  void stop();

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Runs one JSON command and returns the JSON reply.
  //
  // @details
  // Request:  {"command": "<name>", ...arguments}
  // Reply:    {"code": <http status>, ...}
  //
  // Errors never escape: EngineError maps through httpStatusFor(), a
  // malformed request is 400, anything else is logged and answered 500
  // with a generic message.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  EventBus& auditEventBus() { return audit_loop_.eventBus(); }

  Store& store() { return store_; }
  const Ledger& ledger() const { return ledger_; }
  InvestmentLifecycle& lifecycle() { return lifecycle_; }
  PaymentReconciler& reconciler() { return reconciler_; }
  WithdrawalProcessor& withdrawals() { return withdrawals_; }
  const EngineConfig& config() const { return config_; }

  // Validates and inserts a package (create_package command).
  domain::InvestmentPackage createPackage(domain::InvestmentPackage draft);

  // Opens or closes a package for new investments. Existing investments
  // are unaffected.
  domain::InvestmentPackage setPackageStatus(domain::PackageId id,
                                             domain::PackageStatus status);

  bool running() const { return running_; }

 private:
  nlohmann::json dispatch(const nlohmann::json& request);

  nlohmann::json handleCreatePackage(const nlohmann::json& request);
  nlohmann::json handleSetPackageStatus(const nlohmann::json& request);
  nlohmann::json handleListPackages();
  nlohmann::json handleCreateInvestment(const nlohmann::json& request);
  nlohmann::json handleStartPayment(const nlohmann::json& request);
  nlohmann::json handleVerifyPayment(const nlohmann::json& request);
  nlohmann::json handleWebhook(const nlohmann::json& request);
  nlohmann::json handleGetInvestment(const nlohmann::json& request);
  nlohmann::json handleListInvestments(const nlohmann::json& request);
  nlohmann::json handlePaymentStatus(const nlohmann::json& request);
  nlohmann::json handleCompleteInvestment(const nlohmann::json& request);
  nlohmann::json handleCancelInvestment(const nlohmann::json& request);
  nlohmann::json handleRejectInvestment(const nlohmann::json& request);
  nlohmann::json handlePurgeInvestment(const nlohmann::json& request);
  nlohmann::json handleForceApprove(const nlohmann::json& request);
  nlohmann::json handleCreateWithdrawal(const nlohmann::json& request);
  nlohmann::json handleWithdrawalAction(const nlohmann::json& request);
  nlohmann::json handleWithdrawable(const nlohmann::json& request);
  nlohmann::json handleWithdrawalNotes(const nlohmann::json& request);
  nlohmann::json handleLedger(const nlohmann::json& request);

  EngineConfig config_;
  const ITimeProvider& clock_;

  EventLoopThread audit_loop_{"AuditLoop"};
  EventSink sink_;

  Store store_;
  InventoryAllocator allocator_;
  Ledger ledger_;
  PaymentAdapter adapter_;
  InvestmentLifecycle lifecycle_;
  PaymentReconciler reconciler_;
  WithdrawalProcessor withdrawals_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;
  EventBus::SubscriptionId alert_subscription_{0};

  bool running_{false};
};

}  // namespace agrovest
