#pragma once

#include <string>

#include "net/IHttpClient.hpp"
#include "providers/IProvider.hpp"

namespace ddns::providers {

/// Porkbun JSON API v3 provider (dns/editByNameType).
/// Class abbreviation: pp
class PorkbunProvider : public IProvider {
 public:
  PorkbunProvider(net::IHttpClient& hcClient, std::string sApiBase);
  ~PorkbunProvider() override;

  std::string name() const override;
  common::PushResult updateRecord(const security::ApiCredentials& acCreds,
                                  const std::string& sDomain,
                                  const common::DnsRecord& drRecord) override;

  /// Endpoint for editing the sType record of sDomain.
  std::string editUrl(const std::string& sDomain, const std::string& sType) const;

 private:
  net::IHttpClient& _hcClient;
  std::string _sApiBase;
};

}  // namespace ddns::providers
