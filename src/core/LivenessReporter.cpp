#include "core/LivenessReporter.hpp"

#include <utility>

namespace ddns::core {

LivenessReporter::LivenessReporter(net::IHttpClient& hcClient, std::string sBaseUrl)
    : _hcClient(hcClient), _sBaseUrl(std::move(sBaseUrl)) {
  while (!_sBaseUrl.empty() && _sBaseUrl.back() == '/') {
    _sBaseUrl.pop_back();
  }
}

LivenessReporter::~LivenessReporter() = default;

std::string LivenessReporter::pingUrl(const std::string& sUuid) const {
  return _sBaseUrl + "/" + sUuid;
}

common::HttpResponse LivenessReporter::ping(const std::string& sUuid,
                                            const std::string& sMessage) {
  return _hcClient.post(pingUrl(sUuid), sMessage, "text/plain");
}

}  // namespace ddns::core
