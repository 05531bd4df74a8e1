#include "core/IpResolver.hpp"

#include <utility>

namespace ddns::core {

IpResolver::IpResolver(net::IHttpClient& hcClient, std::string sEchoUrl)
    : _hcClient(hcClient), _sEchoUrl(std::move(sEchoUrl)) {}

IpResolver::~IpResolver() = default;

std::string IpResolver::trim(const std::string& sText) {
  constexpr const char* kWhitespace = " \t\r\n\v\f";
  const auto uFirst = sText.find_first_not_of(kWhitespace);
  if (uFirst == std::string::npos) {
    return {};
  }
  const auto uLast = sText.find_last_not_of(kWhitespace);
  return sText.substr(uFirst, uLast - uFirst + 1);
}

common::ResolveResult IpResolver::resolve() {
  common::ResolveResult rr;

  const auto hr = _hcClient.get(_sEchoUrl);
  if (!hr.bCompleted) {
    rr.sErrorMessage = "GET " + _sEchoUrl + " failed: " + hr.sErrorMessage;
    return rr;
  }
  if (hr.iStatusCode < 200 || hr.iStatusCode >= 300) {
    rr.sErrorMessage = "GET " + _sEchoUrl + " returned HTTP " + std::to_string(hr.iStatusCode);
    return rr;
  }

  rr.sIp = trim(hr.sBody);
  if (rr.sIp.empty()) {
    rr.sErrorMessage = "GET " + _sEchoUrl + " returned an empty body";
    return rr;
  }
  rr.bSuccess = true;
  return rr;
}

}  // namespace ddns::core
