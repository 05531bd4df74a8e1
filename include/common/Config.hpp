#pragma once

#include <optional>
#include <string>

namespace ddns::common {

/// Runtime settings loaded from environment variables.
/// Everything has a default; only invalid values are rejected.
/// Class abbreviation: cfg
struct Config {
  // ── Persisted document ────────────────────────────────────────────────
  std::string sConfigPath = "config.json";

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";
  std::optional<std::string> oLogFile = std::string("porkbun_ddns.log");

  // ── Endpoints ─────────────────────────────────────────────────────────
  std::string sIpEchoUrl = "https://www.icanhazip.com/";
  std::string sPorkbunApiBase = "https://api-ipv4.porkbun.com/api/json/v3";
  std::string sHealthchecksBase = "https://hc-ping.com";

  /// Load and validate settings from the environment.
  /// Throws ConfigError on an unknown log level or a malformed URL.
  static Config load();

 private:
  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as bool (true/false/1/0/yes/no).
  static bool getEnvBool(const char* pVarName, bool bDefault);

  /// Read a URL env var, falling back to sDefault. Trailing '/' is kept.
  static std::string getEnvUrl(const char* pVarName, const std::string& sDefault);
};

}  // namespace ddns::common
