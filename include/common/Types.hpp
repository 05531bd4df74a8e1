#pragma once

#include <cstdint>
#include <string>

namespace ddns::common {

/// Outcome of a single HTTP exchange.
/// bCompleted is false when no response was received at all.
/// Class abbreviation: hr
struct HttpResponse {
  bool bCompleted = false;
  long iStatusCode = 0;
  std::string sBody;
  std::string sErrorMessage;
};

/// DNS record content as sent to providers. The owning domain is passed
/// alongside it.
/// Class abbreviation: dr
struct DnsRecord {
  std::string sType = "A";
  uint32_t uTtl = 600;
  std::string sValue;
};

/// Result of a provider edit call.
enum class PushStatus { Applied, Rejected, Unreachable };

/// Result of a provider push operation.
/// Class abbreviation: prs
struct PushResult {
  PushStatus status = PushStatus::Unreachable;
  long iStatusCode = 0;
  std::string sErrorMessage;
};

/// Result of a public address lookup.
/// Class abbreviation: rr
struct ResolveResult {
  bool bSuccess = false;
  std::string sIp;
  std::string sErrorMessage;
};

/// How a run ended when no exception was raised.
enum class RunOutcome { NoChange, Updated, UpdateRejected };

/// Class abbreviation: rres
struct RunResult {
  RunOutcome outcome = RunOutcome::NoChange;
  std::string sMessage;
};

}  // namespace ddns::common
