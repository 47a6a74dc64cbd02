#include "agrovest/payment/webhook_signer.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace agrovest {

WebhookSigner::WebhookSigner(std::string secret) : secret_(std::move(secret)) {}

std::string WebhookSigner::sign(const std::string& body) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  const unsigned char* result =
      HMAC(EVP_sha512(), secret_.data(), static_cast<int>(secret_.size()),
           reinterpret_cast<const unsigned char*>(body.data()), body.size(),
           digest, &digest_len);
  if (result == nullptr) {
    throw EngineError(ErrorCode::Internal, "HMAC-SHA512 computation failed");
  }

  std::ostringstream out;
  for (unsigned int i = 0; i < digest_len; ++i) {
    out << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(digest[i]);
  }
  return out.str();
}

bool WebhookSigner::verify(const std::string& body,
                           const std::string& signature) const {
  if (secret_.empty() || signature.empty()) {
    return false;
  }

  const std::string expected = sign(body);
  if (signature.size() != expected.size()) {
    return false;
  }

  std::string normalized = signature;
  for (auto& c : normalized) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return CRYPTO_memcmp(expected.data(), normalized.data(), expected.size()) ==
         0;
}

}  // namespace agrovest
