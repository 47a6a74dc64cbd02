#include "agrovest/payment/paystack_gateway.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <curl/curl.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

namespace agrovest {

namespace {

std::once_flag g_curl_init_flag;

size_t write_callback(void* contents, size_t size, size_t nmemb,
                      std::string* response) {
  response->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

struct CurlDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

void appendHeader(HeaderList& list, const std::string& header) {
  curl_slist* grown = curl_slist_append(list.get(), header.c_str());
  if (grown == nullptr) {
    throw EngineError(ErrorCode::Internal, "Failed to build HTTP headers");
  }
  list.release();
  list.reset(grown);
}

}  // namespace

PaystackGateway::PaystackGateway(PaystackSettings settings)
    : settings_(std::move(settings)) {
  std::call_once(g_curl_init_flag,
                 [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

GatewayStatus PaystackGateway::mapStatus(const std::string& gateway_status) {
  if (gateway_status == "success") {
    return GatewayStatus::Success;
  }
  if (gateway_status == "failed" || gateway_status == "reversed" ||
      gateway_status == "abandoned") {
    return GatewayStatus::Failed;
  }
  return GatewayStatus::Pending;
}

// -----------------------------------------------------------------------------
// perform(): one HTTP exchange, bounded by timeout_ms
// -----------------------------------------------------------------------------
nlohmann::json PaystackGateway::perform(const std::string& method,
                                        const std::string& path,
                                        const std::string& body) const {
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    throw EngineError(ErrorCode::Internal, "Failed to initialize CURL");
  }

  const std::string url = settings_.base_url + path;
  std::string response;

  HeaderList headers;
  appendHeader(headers, "Authorization: Bearer " + settings_.secret_key);
  appendHeader(headers, "Content-Type: application/json");
  appendHeader(headers, "Accept: application/json");

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, settings_.timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (method == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
  }

  const CURLcode result = curl_easy_perform(curl.get());
  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

  if (result != CURLE_OK) {
    std::cerr << "[PaystackGateway] ERROR: " << method << " " << path
              << " failed: " << curl_easy_strerror(result) << "\n";
    throw EngineError(ErrorCode::GatewayUnavailable,
                      std::string("Payment gateway unreachable: ") +
                          curl_easy_strerror(result));
  }
  if (http_code < 200 || http_code >= 300) {
    std::cerr << "[PaystackGateway] ERROR: " << method << " " << path
              << " returned HTTP " << http_code << "\n";
    throw EngineError(ErrorCode::GatewayUnavailable,
                      "Payment gateway returned HTTP " +
                          std::to_string(http_code));
  }

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(response);
  } catch (const nlohmann::json::exception& e) {
    throw EngineError(ErrorCode::GatewayUnavailable,
                      std::string("Unparsable gateway response: ") + e.what());
  }

  if (!parsed.value("status", false)) {
    throw EngineError(ErrorCode::GatewayUnavailable,
                      "Payment gateway refused request: " +
                          parsed.value("message", std::string("unknown")));
  }
  return parsed.value("data", nlohmann::json::object());
}

// -----------------------------------------------------------------------------
// initialize()
// -----------------------------------------------------------------------------
GatewaySession PaystackGateway::initialize(const std::string& reference,
                                           domain::Money amount,
                                           const PayerProfile& payer,
                                           const nlohmann::json& metadata) {
  nlohmann::json request;
  request["email"] = payer.email;
  request["amount"] = amount.minor();
  request["reference"] = reference;
  if (!settings_.callback_url.empty()) {
    request["callback_url"] = settings_.callback_url;
  }
  request["metadata"] = metadata;

  const nlohmann::json data =
      perform("POST", "/transaction/initialize", request.dump());

  GatewaySession session;
  try {
    session.reference = data.value("reference", reference);
    session.authorization_url = data.at("authorization_url").get<std::string>();
    session.access_code = data.value("access_code", std::string());
  } catch (const nlohmann::json::exception& e) {
    throw EngineError(ErrorCode::GatewayUnavailable,
                      std::string("Malformed initialize response: ") +
                          e.what());
  }
  return session;
}

// -----------------------------------------------------------------------------
// verify()
// -----------------------------------------------------------------------------
GatewayVerification PaystackGateway::verify(const std::string& reference) {
  char* escaped_raw = curl_easy_escape(nullptr, reference.c_str(),
                                       static_cast<int>(reference.size()));
  if (escaped_raw == nullptr) {
    throw EngineError(ErrorCode::Internal, "Failed to escape reference");
  }
  const std::string escaped(escaped_raw);
  curl_free(escaped_raw);

  const nlohmann::json data =
      perform("GET", "/transaction/verify/" + escaped, "");

  GatewayVerification result;
  try {
    result.status = mapStatus(data.at("status").get<std::string>());
    if (data.contains("id") && !data["id"].is_null()) {
      result.gateway_id = data["id"].is_string()
                              ? data["id"].get<std::string>()
                              : data["id"].dump();
    }
    result.amount =
        domain::Money::fromMinor(data.value("amount", std::int64_t{0}));
    result.gateway_response = data.value("gateway_response", std::string());
  } catch (const nlohmann::json::exception& e) {
    throw EngineError(ErrorCode::GatewayUnavailable,
                      std::string("Malformed verify response: ") + e.what());
  }
  result.raw = data;
  return result;
}

}  // namespace agrovest
