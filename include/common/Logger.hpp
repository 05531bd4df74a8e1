#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace ddns::common {

/// Thin factory over spdlog.
/// Loggers are built explicitly and handed to the components that log;
/// nothing is registered in spdlog's global registry.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   auto spLog = Logger::create("info", "porkbun_ddns.log");
///   spLog->info("Current IP: {}", sIp);
class Logger {
 public:
  /// Build a logger writing to the console and, if oFilePath is set,
  /// to that file (truncated on open).
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static std::shared_ptr<spdlog::logger> create(const std::string& sLevel,
                                                const std::optional<std::string>& oFilePath);

  /// True if sLevel names a spdlog level.
  static bool isValidLevel(const std::string& sLevel);

 private:
  static constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
  static constexpr const char* kLoggerName = "porkbun-ddns";
};

}  // namespace ddns::common
