#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ddns::common {

/// Base error for all application-level exceptions.
/// Carries the process exit status and a machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Exit 2: config document unreadable or malformed, or a required key is absent.
/// Also raised for invalid runtime settings.
struct ConfigError : AppError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : AppError(2, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 3: an HTTP call could not be completed.
struct NetworkError : AppError {
  explicit NetworkError(std::string sCode, std::string sMsg)
      : AppError(3, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace ddns::common
