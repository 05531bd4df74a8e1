#pragma once

#include <string>

namespace ddns::security {

/// OPENSSL_cleanse the whole allocated buffer of sValue (capacity, not
/// size, so bytes left behind by a move or shrink are covered), then clear it.
void wipeString(std::string& sValue);

/// Porkbun API key pair.
/// Both strings are wiped via OPENSSL_cleanse when the object dies.
/// Class abbreviation: ac
class ApiCredentials {
 public:
  ApiCredentials(std::string sApiKey, std::string sSecretApiKey);
  ~ApiCredentials();

  ApiCredentials(const ApiCredentials&) = delete;
  ApiCredentials& operator=(const ApiCredentials&) = delete;
  ApiCredentials(ApiCredentials&& other) noexcept;
  ApiCredentials& operator=(ApiCredentials&& other) noexcept;

  const std::string& apiKey() const { return _sApiKey; }
  const std::string& secretApiKey() const { return _sSecretApiKey; }

 private:
  void wipe();

  std::string _sApiKey;
  std::string _sSecretApiKey;
};

}  // namespace ddns::security
