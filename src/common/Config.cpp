#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <cstdlib>
#include <string>

namespace ddns::common {

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  if (sValue == "true" || sValue == "1" || sValue == "yes") {
    return true;
  }
  if (sValue == "false" || sValue == "0" || sValue == "no") {
    return false;
  }
  throw ConfigError("invalid_setting",
                    std::string("Invalid boolean value for ") + pVarName + ": " + sValue);
}

std::string Config::getEnvUrl(const char* pVarName, const std::string& sDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return sDefault;
  }
  if (sValue.rfind("http://", 0) != 0 && sValue.rfind("https://", 0) != 0) {
    throw ConfigError("invalid_setting",
                      std::string(pVarName) + " must be an http:// or https:// URL (got " +
                          sValue + ")");
  }
  return sValue;
}

Config Config::load() {
  Config cfg;

  const std::string sConfigPath = getEnv("DDNS_CONFIG_PATH");
  if (!sConfigPath.empty()) {
    cfg.sConfigPath = sConfigPath;
  }

  // Logging
  const std::string sLogLevel = getEnv("DDNS_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    if (!Logger::isValidLevel(sLogLevel)) {
      throw ConfigError("invalid_setting", "Unknown DDNS_LOG_LEVEL: " + sLogLevel);
    }
    cfg.sLogLevel = sLogLevel;
  }

  const std::string sLogFile = getEnv("DDNS_LOG_FILE");
  if (!sLogFile.empty()) {
    cfg.oLogFile = sLogFile;
  }
  if (!getEnvBool("DDNS_LOG_TO_FILE", true)) {
    cfg.oLogFile.reset();
  }

  // Endpoints
  cfg.sIpEchoUrl = getEnvUrl("DDNS_IP_ECHO_URL", cfg.sIpEchoUrl);
  cfg.sPorkbunApiBase = getEnvUrl("DDNS_PORKBUN_API_BASE", cfg.sPorkbunApiBase);
  cfg.sHealthchecksBase = getEnvUrl("DDNS_HEALTHCHECKS_BASE", cfg.sHealthchecksBase);

  return cfg;
}

}  // namespace ddns::common
