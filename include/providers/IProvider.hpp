#pragma once

#include <string>

#include "common/Types.hpp"
#include "security/ApiCredentials.hpp"

namespace ddns::providers {

/// Pure abstract interface for DNS provider integrations.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string name() const = 0;

  /// Overwrite the existing record of drRecord.sType under sDomain.
  /// Never creates records. Transport failures are reported through
  /// PushStatus::Unreachable, not thrown.
  virtual common::PushResult updateRecord(const security::ApiCredentials& acCreds,
                                          const std::string& sDomain,
                                          const common::DnsRecord& drRecord) = 0;
};

}  // namespace ddns::providers
