#include "security/ApiCredentials.hpp"

#include <openssl/crypto.h>

#include <utility>

namespace ddns::security {

void wipeString(std::string& sValue) {
  // Grow to capacity without reallocating so stale bytes past size() are reachable
  sValue.resize(sValue.capacity());
  OPENSSL_cleanse(sValue.data(), sValue.size());
  sValue.clear();
}

ApiCredentials::ApiCredentials(std::string sApiKey, std::string sSecretApiKey)
    : _sApiKey(std::move(sApiKey)), _sSecretApiKey(std::move(sSecretApiKey)) {
  // Short keys live in the by-value parameters' inline buffers after the move
  wipeString(sApiKey);
  wipeString(sSecretApiKey);
}

ApiCredentials::~ApiCredentials() { wipe(); }

ApiCredentials::ApiCredentials(ApiCredentials&& other) noexcept
    : _sApiKey(std::move(other._sApiKey)), _sSecretApiKey(std::move(other._sSecretApiKey)) {
  other.wipe();
}

ApiCredentials& ApiCredentials::operator=(ApiCredentials&& other) noexcept {
  if (this != &other) {
    wipe();
    _sApiKey = std::move(other._sApiKey);
    _sSecretApiKey = std::move(other._sSecretApiKey);
    other.wipe();
  }
  return *this;
}

void ApiCredentials::wipe() {
  wipeString(_sApiKey);
  wipeString(_sSecretApiKey);
}

}  // namespace ddns::security
