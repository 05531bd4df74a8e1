#include "providers/PorkbunProvider.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace ddns::providers {

PorkbunProvider::PorkbunProvider(net::IHttpClient& hcClient, std::string sApiBase)
    : _hcClient(hcClient), _sApiBase(std::move(sApiBase)) {
  while (!_sApiBase.empty() && _sApiBase.back() == '/') {
    _sApiBase.pop_back();
  }
}

PorkbunProvider::~PorkbunProvider() = default;

std::string PorkbunProvider::name() const { return "porkbun"; }

std::string PorkbunProvider::editUrl(const std::string& sDomain,
                                     const std::string& sType) const {
  return _sApiBase + "/dns/editByNameType/" + sDomain + "/" + sType + "/";
}

common::PushResult PorkbunProvider::updateRecord(const security::ApiCredentials& acCreds,
                                                 const std::string& sDomain,
                                                 const common::DnsRecord& drRecord) {
  nlohmann::json jPayload = {
      {"apikey", acCreds.apiKey()},
      {"secretapikey", acCreds.secretApiKey()},
      {"content", drRecord.sValue},
      {"ttl", drRecord.uTtl}};
  std::string sBody = jPayload.dump();
  security::wipeString(jPayload["apikey"].get_ref<std::string&>());
  security::wipeString(jPayload["secretapikey"].get_ref<std::string&>());

  const auto hr = _hcClient.post(editUrl(sDomain, drRecord.sType), sBody, "application/json");

  // Serialized body carries the secret key
  security::wipeString(sBody);

  common::PushResult prs;
  if (!hr.bCompleted) {
    prs.status = common::PushStatus::Unreachable;
    prs.sErrorMessage = hr.sErrorMessage;
    return prs;
  }

  prs.iStatusCode = hr.iStatusCode;
  if (hr.iStatusCode == 200) {
    prs.status = common::PushStatus::Applied;
  } else {
    // Body is passed through for logging only; it is never interpreted
    prs.status = common::PushStatus::Rejected;
    prs.sErrorMessage = hr.sBody;
  }
  return prs;
}

}  // namespace ddns::providers
