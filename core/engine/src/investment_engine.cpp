#include "agrovest/engine/investment_engine.hpp"

#include "agrovest/errors/engine_error.hpp"
#include "agrovest/network/json_codec.hpp"
#include "agrovest/store/unit_of_work.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace agrovest {

namespace {

constexpr std::size_t kDefaultLedgerLimit = 50;

// Amounts arrive either as decimal strings ("200.00") or JSON numbers.
domain::Money moneyField(const nlohmann::json& request, const char* key) {
  const nlohmann::json& value = request.at(key);
  if (value.is_string()) {
    return domain::Money::parse(value.get<std::string>());
  }
  if (value.is_number()) {
    return domain::Money::parse(value.dump());
  }
  throw EngineError(ErrorCode::Validation,
                    std::string("Field '") + key + "' must be an amount");
}

domain::Money optionalMoneyField(const nlohmann::json& request,
                                 const char* key) {
  if (!request.contains(key) || request.at(key).is_null()) {
    return domain::Money{};
  }
  return moneyField(request, key);
}

std::uint64_t idField(const nlohmann::json& request, const char* key) {
  const auto id = request.at(key).get<std::int64_t>();
  if (id <= 0) {
    throw EngineError(ErrorCode::Validation,
                      std::string("Field '") + key + "' must be positive");
  }
  return static_cast<std::uint64_t>(id);
}

// Committed investment owned by `user`; anything else reads as not found.
domain::Investment ownedInvestment(const InvestmentLifecycle& lifecycle,
                                   domain::UserId user,
                                   domain::InvestmentId id) {
  auto investment = lifecycle.investment(id);
  if (!investment.has_value() || investment->user_id != user) {
    throw EngineError(ErrorCode::NotFound,
                      "Investment " + std::to_string(id) + " not found");
  }
  return *investment;
}

nlohmann::json ok(nlohmann::json body = nlohmann::json::object()) {
  body["code"] = 200;
  return body;
}

nlohmann::json errorReply(const EngineError& e) {
  nlohmann::json reply;
  reply["code"] = httpStatusFor(e.code());
  reply["error"] = e.what();
  reply["error_code"] = errorCodeToString(e.code());
  if (e.callerRetryable()) {
    reply["retryable"] = true;
  }
  if (!e.currentState().empty()) {
    reply["current_state"] = e.currentState();
  }
  return reply;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
InvestmentEngine::InvestmentEngine(EngineConfig config,
                                   const ITimeProvider& clock,
                                   IPaymentGateway& gateway)
    : config_(std::move(config)),
      clock_(clock),
      sink_([this](Event event) { audit_loop_.push(std::move(event)); }),
      store_(std::chrono::milliseconds(config_.store.lock_timeout_ms)),
      ledger_(store_, clock_),
      adapter_(gateway, WebhookSigner(config_.gateway.secret_key)),
      lifecycle_(store_, allocator_, ledger_, adapter_, clock_, sink_,
                 config_.lifecycle),
      reconciler_(store_, adapter_, lifecycle_),
      withdrawals_(store_, ledger_, clock_, sink_) {
  alert_subscription_ =
      audit_loop_.eventBus().subscribe<ReconciliationAlertEvent>(
          [](const ReconciliationAlertEvent& e) {
            std::cerr << "[Audit] RECONCILIATION reference=" << e.reference
                      << " investment="
                      << (e.investment_id.has_value()
                              ? std::to_string(*e.investment_id)
                              : std::string("-"))
                      << " reason=" << e.reason << "\n";
          });
}

InvestmentEngine::~InvestmentEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void InvestmentEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Audit loop --------------------------------------------------------
  audit_loop_.start();

  // ---  2) IpcServer (commands + telemetry) ----------------------------------
  if (!config_.ipc.cmd_endpoint.empty() && !config_.ipc.pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint,
        static_cast<std::size_t>(config_.ipc.command_workers));
    try {
      ipc_server_->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[InvestmentEngine] ERROR: IPC bind failed: " << e.what()
                << "\n";
      ipc_server_.reset();
      audit_loop_.stop();
      throw;
    }

    IpcServer* server = ipc_server_.get();
    telemetry_subscription_ = audit_loop_.eventBus().subscribe(
        [server](const Event& e) { server->pushTelemetry(e); });
  }

  running_ = true;

  std::cout << "[InvestmentEngine] started. gateway="
            << toString(config_.gateway.mode)
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void InvestmentEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new commands ----------------------------------------------------
  if (telemetry_subscription_.has_value()) {
    audit_loop_.eventBus().unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  ipc_server_.reset();

  // ---  2) Flush and join the audit loop --------------------------------------
  audit_loop_.stop();

  running_ = false;

  std::cout << "[InvestmentEngine] stopped. All threads joined.\n";
}

domain::InvestmentPackage InvestmentEngine::createPackage(
    domain::InvestmentPackage draft) {
  return withContentionRetry("InvestmentEngine", [&] {
    UnitOfWork unit(store_, clock_, sink_);
    auto pkg = allocator_.createPackage(unit, draft);
    unit.commit();
    std::cout << "[InvestmentEngine] package " << pkg.id << " '" << pkg.name
              << "' kind=" << domain::toString(pkg.kind)
              << " slots=" << pkg.available_slots << "/" << pkg.total_slots
              << "\n";
    return pkg;
  });
}

domain::InvestmentPackage InvestmentEngine::setPackageStatus(
    domain::PackageId id, domain::PackageStatus status) {
  return withContentionRetry("InvestmentEngine", [&] {
    UnitOfWork unit(store_, clock_, sink_);
    auto pkg = allocator_.setStatus(unit, id, status);
    unit.commit();
    std::cout << "[InvestmentEngine] package " << id << " is now "
              << domain::toString(status) << "\n";
    return pkg;
  });
}

// -----------------------------------------------------------------------------
// executeCommand(): parse, dispatch, map errors
// -----------------------------------------------------------------------------
std::string InvestmentEngine::executeCommand(const std::string& request) {
  nlohmann::json response;

  try {
    const nlohmann::json parsed = nlohmann::json::parse(request);
    if (!parsed.is_object()) {
      throw EngineError(ErrorCode::Validation,
                        "Request must be a JSON object");
    }
    response = dispatch(parsed);
  } catch (const EngineError& e) {
    if (e.code() == ErrorCode::Internal) {
      std::cerr << "[InvestmentEngine] ERROR: " << e.what() << "\n";
      response["code"] = 500;
      response["error"] = "Internal error";
      response["error_code"] = errorCodeToString(e.code());
    } else {
      response = errorReply(e);
    }
  } catch (const nlohmann::json::exception& e) {
    response = nlohmann::json::object();
    response["code"] = 400;
    response["error"] = std::string("Malformed request: ") + e.what();
    response["error_code"] = errorCodeToString(ErrorCode::Validation);
  } catch (const std::exception& e) {
    std::cerr << "[InvestmentEngine] ERROR: unexpected exception: " << e.what()
              << "\n";
    response = nlohmann::json::object();
    response["code"] = 500;
    response["error"] = "Internal error";
    response["error_code"] = errorCodeToString(ErrorCode::Internal);
  }

  return response.dump();
}

nlohmann::json InvestmentEngine::dispatch(const nlohmann::json& request) {
  const std::string command = request.at("command").get<std::string>();

  if (command == "ping") {
    return ok({{"status", "ok"}, {"response", "pong"}});
  }
  if (command == "create_package") return handleCreatePackage(request);
  if (command == "set_package_status") return handleSetPackageStatus(request);
  if (command == "list_packages") return handleListPackages();
  if (command == "create_investment") return handleCreateInvestment(request);
  if (command == "start_payment") return handleStartPayment(request);
  if (command == "verify_payment") return handleVerifyPayment(request);
  if (command == "webhook") return handleWebhook(request);
  if (command == "get_investment") return handleGetInvestment(request);
  if (command == "list_investments") return handleListInvestments(request);
  if (command == "payment_status") return handlePaymentStatus(request);
  if (command == "complete_investment") return handleCompleteInvestment(request);
  if (command == "cancel_investment") return handleCancelInvestment(request);
  if (command == "reject_investment") return handleRejectInvestment(request);
  if (command == "purge_investment") return handlePurgeInvestment(request);
  if (command == "force_approve") return handleForceApprove(request);
  if (command == "create_withdrawal") return handleCreateWithdrawal(request);
  if (command == "withdrawal_action") return handleWithdrawalAction(request);
  if (command == "withdrawable") return handleWithdrawable(request);
  if (command == "withdrawal_notes") return handleWithdrawalNotes(request);
  if (command == "ledger") return handleLedger(request);

  throw EngineError(ErrorCode::Validation, "Unknown command '" + command + "'");
}

// -----------------------------------------------------------------------------
// Packages
// -----------------------------------------------------------------------------
nlohmann::json InvestmentEngine::handleCreatePackage(
    const nlohmann::json& request) {
  domain::InvestmentPackage draft;
  draft.name = request.at("name").get<std::string>();

  const std::string kind = request.value("kind", std::string("direct"));
  auto parsed_kind = domain::parsePackageKind(kind);
  if (!parsed_kind.has_value()) {
    throw EngineError(ErrorCode::Validation,
                      "Unknown package kind '" + kind + "'");
  }
  draft.kind = *parsed_kind;
  draft.total_slots = request.at("total_slots").get<std::int64_t>();
  draft.available_slots =
      request.value("available_slots", draft.total_slots);
  draft.terms.rate_bps = request.at("rate_bps").get<std::int32_t>();
  draft.terms.duration_days = request.at("duration_days").get<std::int32_t>();
  draft.min_amount = optionalMoneyField(request, "min_amount");
  draft.max_amount = optionalMoneyField(request, "max_amount");

  const auto pkg = createPackage(draft);
  return ok({{"package", toJson(pkg)}});
}

nlohmann::json InvestmentEngine::handleSetPackageStatus(
    const nlohmann::json& request) {
  const std::string status_text = request.at("status").get<std::string>();
  auto status = domain::parsePackageStatus(status_text);
  if (!status.has_value()) {
    throw EngineError(ErrorCode::Validation,
                      "Unknown package status '" + status_text + "'");
  }
  const auto pkg = setPackageStatus(idField(request, "package_id"), *status);
  return ok({{"package", toJson(pkg)}});
}

nlohmann::json InvestmentEngine::handleListPackages() {
  nlohmann::json packages = nlohmann::json::array();
  for (const auto& pkg : store_.packages()) {
    packages.push_back(toJson(pkg));
  }
  return ok({{"packages", std::move(packages)}});
}

// -----------------------------------------------------------------------------
// Investments and payments
// -----------------------------------------------------------------------------
nlohmann::json InvestmentEngine::handleCreateInvestment(
    const nlohmann::json& request) {
  const auto investment = lifecycle_.createInvestment(
      idField(request, "user_id"), idField(request, "package_id"),
      moneyField(request, "amount"), request.value("units", std::int64_t{1}));
  return ok({{"investment", toJson(investment)}});
}

nlohmann::json InvestmentEngine::handleStartPayment(
    const nlohmann::json& request) {
  PayerProfile payer;
  payer.user_id = idField(request, "user_id");
  payer.email = request.value("email", std::string());
  payer.full_name = request.value("full_name", std::string());

  const PaymentStart started = lifecycle_.startPayment(
      payer.user_id, idField(request, "investment_id"), payer);

  nlohmann::json body;
  body["payment"] = toJson(started.payment);
  body["authorization_url"] = started.session.authorization_url;
  body["access_code"] = started.session.access_code;
  body["reference"] = started.session.reference;
  return ok(std::move(body));
}

nlohmann::json InvestmentEngine::handleVerifyPayment(
    const nlohmann::json& request) {
  const VerifyResult result = reconciler_.verify(
      idField(request, "user_id"),
      request.value("reference", std::string()));

  nlohmann::json body;
  body["status"] = toString(result.status);
  body["message"] = result.message;
  body["payment"] = toJson(result.payment);
  if (result.already_processed) {
    body["already_processed"] = true;
  }
  return ok(std::move(body));
}

nlohmann::json InvestmentEngine::handleWebhook(const nlohmann::json& request) {
  const WebhookResult result = reconciler_.handleWebhook(
      request.at("body").get<std::string>(),
      request.value("signature", std::string()));

  nlohmann::json body;
  body["event"] = result.event_name;
  body["reference"] = result.reference;
  switch (result.disposition) {
    case WebhookDisposition::Processed:
      body["status"] = "success";
      break;
    case WebhookDisposition::AlreadyProcessed:
      body["status"] = "success";
      body["already_processed"] = true;
      break;
    case WebhookDisposition::Ignored:
      body["status"] = "ignored";
      break;
  }
  return ok(std::move(body));
}

nlohmann::json InvestmentEngine::handleGetInvestment(
    const nlohmann::json& request) {
  const auto investment = ownedInvestment(
      lifecycle_, idField(request, "user_id"), idField(request, "investment_id"));

  nlohmann::json payments = nlohmann::json::array();
  for (const auto& payment : lifecycle_.paymentsForInvestment(investment.id)) {
    payments.push_back(toJson(payment));
  }
  nlohmann::json transactions = nlohmann::json::array();
  for (const auto& entry : ledger_.entriesForInvestment(investment.id)) {
    transactions.push_back(toJson(entry));
  }
  return ok({{"investment", toJson(investment)},
             {"payments", std::move(payments)},
             {"transactions", std::move(transactions)}});
}

nlohmann::json InvestmentEngine::handleListInvestments(
    const nlohmann::json& request) {
  std::optional<domain::InvestmentStatus> status;
  if (request.contains("status")) {
    const std::string status_text = request.at("status").get<std::string>();
    status = domain::parseInvestmentStatus(status_text);
    if (!status.has_value()) {
      throw EngineError(ErrorCode::Validation,
                        "Unknown investment status '" + status_text + "'");
    }
  }

  nlohmann::json investments = nlohmann::json::array();
  for (const auto& inv :
       lifecycle_.investmentsForUser(idField(request, "user_id"))) {
    if (!status.has_value() || inv.status == *status) {
      investments.push_back(toJson(inv));
    }
  }
  return ok({{"investments", std::move(investments)}});
}

nlohmann::json InvestmentEngine::handlePaymentStatus(
    const nlohmann::json& request) {
  const auto investment = ownedInvestment(
      lifecycle_, idField(request, "user_id"), idField(request, "investment_id"));
  const auto payments = lifecycle_.paymentsForInvestment(investment.id);

  nlohmann::json body;
  body["investment_id"] = investment.id;
  body["attempts"] = payments.size();
  if (payments.empty()) {
    body["payment_status"] = "no_payment";
    body["can_approve"] = false;
    return ok(std::move(body));
  }

  // The successful attempt if there is one, otherwise the latest.
  const domain::Payment* shown = &payments.back();
  for (const auto& payment : payments) {
    if (payment.status == domain::PaymentStatus::Success) {
      shown = &payment;
    }
  }
  body["payment_status"] = domain::toString(shown->status);
  body["payment_amount"] = toJson(shown->amount);
  body["payment_date"] = shown->created_at;
  body["reference"] = shown->reference;
  body["can_approve"] = shown->status == domain::PaymentStatus::Success;
  return ok(std::move(body));
}

nlohmann::json InvestmentEngine::handleCompleteInvestment(
    const nlohmann::json& request) {
  const auto investment = lifecycle_.complete(
      idField(request, "user_id"), idField(request, "investment_id"));
  return ok({{"investment", toJson(investment)}});
}

nlohmann::json InvestmentEngine::handleCancelInvestment(
    const nlohmann::json& request) {
  const auto investment = lifecycle_.cancel(
      idField(request, "user_id"), idField(request, "investment_id"));
  nlohmann::json body;
  body["investment"] = toJson(investment);
  body["purged"] = lifecycle_.options().purge_cancelled_on_cancel;
  body["message"] = "Investment cancelled and refunded";
  return ok(std::move(body));
}

nlohmann::json InvestmentEngine::handleRejectInvestment(
    const nlohmann::json& request) {
  const auto investment =
      lifecycle_.reject(idField(request, "investment_id"));
  return ok({{"investment", toJson(investment)},
             {"message", "Investment rejected"}});
}

nlohmann::json InvestmentEngine::handlePurgeInvestment(
    const nlohmann::json& request) {
  const auto id = idField(request, "investment_id");
  lifecycle_.purge(id);
  return ok({{"investment_id", id}, {"purged", true}});
}

nlohmann::json InvestmentEngine::handleForceApprove(
    const nlohmann::json& request) {
  const ConfirmationResult result =
      lifecycle_.forceApprove(idField(request, "investment_id"));
  nlohmann::json body;
  body["payment"] = toJson(result.payment);
  if (result.investment.has_value()) {
    body["investment"] = toJson(*result.investment);
  }
  if (result.outcome == ConfirmationOutcome::AlreadyProcessed) {
    body["already_processed"] = true;
  }
  return ok(std::move(body));
}

// -----------------------------------------------------------------------------
// Withdrawals
// -----------------------------------------------------------------------------
nlohmann::json InvestmentEngine::handleCreateWithdrawal(
    const nlohmann::json& request) {
  const std::string type_text = request.value("type", std::string("interest"));
  auto type = domain::parseWithdrawalType(type_text);
  if (!type.has_value()) {
    throw EngineError(ErrorCode::Validation,
                      "Unknown withdrawal type '" + type_text + "'");
  }

  std::optional<std::vector<domain::InvestmentId>> ids;
  if (request.contains("investment_ids") &&
      !request.at("investment_ids").is_null()) {
    ids = request.at("investment_ids").get<std::vector<domain::InvestmentId>>();
  }

  const auto withdrawal =
      withdrawals_.createWithdrawal(idField(request, "user_id"), *type, ids);
  return ok({{"withdrawal", toJson(withdrawal)}});
}

nlohmann::json InvestmentEngine::handleWithdrawalAction(
    const nlohmann::json& request) {
  const std::string action_text = request.at("action").get<std::string>();
  auto action = parseWithdrawalAction(action_text);
  if (!action.has_value()) {
    throw EngineError(ErrorCode::Validation,
                      "Unknown withdrawal action '" + action_text + "'");
  }
  const auto withdrawal =
      withdrawals_.applyAction(idField(request, "withdrawal_id"), *action);
  return ok({{"withdrawal", toJson(withdrawal)}});
}

nlohmann::json InvestmentEngine::handleWithdrawable(
    const nlohmann::json& request) {
  nlohmann::json investments = nlohmann::json::array();
  for (const auto& inv : withdrawals_.withdrawable(idField(request, "user_id"))) {
    investments.push_back(toJson(inv));
  }
  return ok({{"investments", std::move(investments)}});
}

nlohmann::json InvestmentEngine::handleWithdrawalNotes(
    const nlohmann::json& request) {
  const auto withdrawal = withdrawals_.updateNotes(
      idField(request, "withdrawal_id"),
      request.value("notes", std::string()));
  return ok({{"withdrawal", toJson(withdrawal)}});
}

// -----------------------------------------------------------------------------
// Ledger
// -----------------------------------------------------------------------------
nlohmann::json InvestmentEngine::handleLedger(const nlohmann::json& request) {
  const auto user = idField(request, "user_id");

  std::vector<domain::LedgerEntry> entries;
  if (request.contains("type")) {
    const std::string type_text = request.at("type").get<std::string>();
    auto type = domain::parseTransactionType(type_text);
    if (!type.has_value()) {
      throw EngineError(ErrorCode::Validation,
                        "Unknown transaction type '" + type_text + "'");
    }
    entries = ledger_.entriesByType(user, *type);
  } else {
    entries = ledger_.recent(
        user, request.value("limit", kDefaultLedgerLimit));
  }

  nlohmann::json out = nlohmann::json::array();
  for (const auto& entry : entries) {
    out.push_back(toJson(entry));
  }
  return ok({{"entries", std::move(out)}});
}

}  // namespace agrovest
