#pragma once

#include <string>

namespace agrovest {

// -----------------------------------------------------------------------------
// WebhookSigner
// -----------------------------------------------------------------------------
//
// @brief  HMAC-SHA512 over the raw webhook body, keyed by the gateway secret.
//
// @details
// The gateway sends the lowercase hex digest in the X-Paystack-Signature
// header. verify() recomputes it over the exact bytes received (never a
// re-serialized JSON) and compares in constant time with CRYPTO_memcmp.
//
// Thread-safety: const methods only; the digest buffer is stack-local.
// -----------------------------------------------------------------------------
class WebhookSigner {
 public:
  explicit WebhookSigner(std::string secret);

  // Lowercase hex HMAC-SHA512 of body (128 characters).
  std::string sign(const std::string& body) const;

  // False for an empty or wrong-length signature as well as a mismatch.
  // Accepts upper- or lowercase hex.
  bool verify(const std::string& body, const std::string& signature) const;

  bool hasSecret() const { return !secret_.empty(); }

 private:
  std::string secret_;
};

}  // namespace agrovest
