#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "security/ApiCredentials.hpp"

namespace ddns::core {

/// Typed view of the persisted config document.
/// jDocument keeps the raw object so that keys unknown to the program
/// survive a rewrite. The API keys live only there and are wiped when
/// the config dies; use ConfigStore::credentials() to read them.
/// Class abbreviation: dc
struct DdnsConfig {
  std::string sDomain;
  std::string sLastIp;            // empty on first run
  std::string sHealthchecksUuid;  // empty disables liveness pings
  nlohmann::json jDocument = nlohmann::json::object();

  DdnsConfig() = default;
  ~DdnsConfig();

  DdnsConfig(const DdnsConfig&) = delete;
  DdnsConfig& operator=(const DdnsConfig&) = delete;
  DdnsConfig(DdnsConfig&&) = default;
  DdnsConfig& operator=(DdnsConfig&&) = default;
};

/// Reads and rewrites the JSON config document at a fixed path.
/// No locking: one run at a time is assumed.
/// Class abbreviation: cs
class ConfigStore {
 public:
  explicit ConfigStore(std::string sPath);
  ~ConfigStore();

  /// Read and parse the document.
  /// Throws ConfigError if the file is missing, is not a JSON object,
  /// lacks "domain", or holds a non-string value under a known key.
  DdnsConfig load() const;

  /// Rewrite the whole document (two-space indent).
  /// Known keys that were null in the file stay null while empty.
  /// Throws ConfigError if the file cannot be written.
  void save(const DdnsConfig& dcConfig) const;

  /// Validate a raw document and build the typed view.
  static DdnsConfig parse(nlohmann::json jDocument);

  /// Copy the API key pair out of the document.
  /// Throws ConfigError if either key is absent or empty.
  static security::ApiCredentials credentials(const DdnsConfig& dcConfig);

  /// Wipe the "apikey" and "secretapikey" strings of a raw document in place.
  static void wipeSecrets(nlohmann::json& jDocument);

  const std::string& path() const { return _sPath; }

 private:
  std::string _sPath;
};

}  // namespace ddns::core
