#include "core/ConfigStore.hpp"

#include "common/Errors.hpp"

#include <fstream>
#include <optional>
#include <utility>

namespace ddns::core {

namespace {
constexpr const char* kKeyApiKey = "apikey";
constexpr const char* kKeySecretApiKey = "secretapikey";
constexpr const char* kKeyDomain = "domain";
constexpr const char* kKeyLastIp = "lastIP";
constexpr const char* kKeyHealthchecksUuid = "healthchecksUUID";

/// Absent and null both yield nullptr; anything but a string is an error.
const std::string* findString(const nlohmann::json& jDocument, const char* pKey) {
  auto it = jDocument.find(pKey);
  if (it == jDocument.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_string()) {
    throw common::ConfigError("config_invalid_key",
                              std::string("Config key '") + pKey + "' must be a string");
  }
  return &it->get_ref<const std::string&>();
}

/// Set a known key, leaving an existing null alone while the value is empty.
void assignKnown(nlohmann::json& jOut, const char* pKey, const std::string& sValue) {
  auto it = jOut.find(pKey);
  if (sValue.empty() && (it == jOut.end() || it->is_null())) {
    return;
  }
  jOut[pKey] = sValue;
}

const std::string* requireSecret(const nlohmann::json& jDocument, const char* pKey) {
  const std::string* pValue = findString(jDocument, pKey);
  if (pValue == nullptr || pValue->empty()) {
    throw common::ConfigError("config_missing_key",
                              std::string("Config key '") + pKey + "' is required");
  }
  return pValue;
}

}  // namespace

DdnsConfig::~DdnsConfig() { ConfigStore::wipeSecrets(jDocument); }

ConfigStore::ConfigStore(std::string sPath) : _sPath(std::move(sPath)) {}

ConfigStore::~ConfigStore() = default;

void ConfigStore::wipeSecrets(nlohmann::json& jDocument) {
  if (!jDocument.is_object()) {
    return;
  }
  for (const char* pKey : {kKeyApiKey, kKeySecretApiKey}) {
    auto it = jDocument.find(pKey);
    if (it != jDocument.end() && it->is_string()) {
      security::wipeString(it->get_ref<std::string&>());
    }
  }
}

DdnsConfig ConfigStore::parse(nlohmann::json jDocument) {
  if (!jDocument.is_object()) {
    throw common::ConfigError("config_malformed", "Config document must be a JSON object");
  }

  DdnsConfig dc;
  try {
    const std::string* pDomain = findString(jDocument, kKeyDomain);
    if (pDomain == nullptr || pDomain->empty()) {
      throw common::ConfigError("config_missing_key", "Config key 'domain' is required");
    }
    const std::string* pLastIp = findString(jDocument, kKeyLastIp);
    const std::string* pUuid = findString(jDocument, kKeyHealthchecksUuid);
    // Type-check only; the keys themselves stay in the document
    findString(jDocument, kKeyApiKey);
    findString(jDocument, kKeySecretApiKey);

    dc.sDomain = *pDomain;
    dc.sLastIp = pLastIp ? *pLastIp : std::string{};
    dc.sHealthchecksUuid = pUuid ? *pUuid : std::string{};
  } catch (const common::ConfigError&) {
    // The document is dropped here, so its keys go with it
    wipeSecrets(jDocument);
    throw;
  }
  dc.jDocument = std::move(jDocument);
  return dc;
}

DdnsConfig ConfigStore::load() const {
  std::ifstream ifs(_sPath);
  if (!ifs.is_open()) {
    throw common::ConfigError("config_missing", "Cannot open config file: " + _sPath);
  }

  nlohmann::json jDocument;
  try {
    jDocument = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::ConfigError("config_malformed",
                              "Config file " + _sPath + " is not valid JSON: " + ex.what());
  }
  return parse(std::move(jDocument));
}

void ConfigStore::save(const DdnsConfig& dcConfig) const {
  nlohmann::json jOut = dcConfig.jDocument.is_object() ? dcConfig.jDocument
                                                        : nlohmann::json::object();
  assignKnown(jOut, kKeyDomain, dcConfig.sDomain);
  assignKnown(jOut, kKeyLastIp, dcConfig.sLastIp);
  assignKnown(jOut, kKeyHealthchecksUuid, dcConfig.sHealthchecksUuid);

  std::string sText = jOut.dump(2);
  wipeSecrets(jOut);

  std::ofstream ofs(_sPath, std::ios::out | std::ios::trunc);
  if (!ofs.is_open()) {
    security::wipeString(sText);
    throw common::ConfigError("config_write_failed", "Cannot open config file for writing: " +
                                                         _sPath);
  }
  // Newline goes to the stream so sText never reallocates before the wipe
  ofs << sText << '\n';
  security::wipeString(sText);
  ofs.close();
  if (ofs.fail()) {
    throw common::ConfigError("config_write_failed", "Failed writing config file: " + _sPath);
  }
}

security::ApiCredentials ConfigStore::credentials(const DdnsConfig& dcConfig) {
  const std::string* pApiKey = requireSecret(dcConfig.jDocument, kKeyApiKey);
  const std::string* pSecretApiKey = requireSecret(dcConfig.jDocument, kKeySecretApiKey);
  return security::ApiCredentials(*pApiKey, *pSecretApiKey);
}

}  // namespace ddns::core
