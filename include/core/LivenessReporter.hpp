#pragma once

#include <string>

#include "common/Types.hpp"
#include "net/IHttpClient.hpp"

namespace ddns::core {

/// Sends a Healthchecks.io success ping: POST {base}/{uuid} with a
/// plain-text diagnostic body.
/// Class abbreviation: lr
class LivenessReporter {
 public:
  LivenessReporter(net::IHttpClient& hcClient, std::string sBaseUrl);
  ~LivenessReporter();

  /// The caller decides what a failed response means.
  common::HttpResponse ping(const std::string& sUuid, const std::string& sMessage);

  std::string pingUrl(const std::string& sUuid) const;

 private:
  net::IHttpClient& _hcClient;
  std::string _sBaseUrl;
};

}  // namespace ddns::core
