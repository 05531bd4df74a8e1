#pragma once

#include <string>

#include "net/IHttpClient.hpp"

namespace ddns::net {

/// RAII owner of libcurl's process-wide state.
/// Construct exactly once in main() before any CurlHttpClient is used.
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/// libcurl easy-interface client. One handle per request, IPv4 only.
/// Class abbreviation: hc
class CurlHttpClient : public IHttpClient {
 public:
  explicit CurlHttpClient(std::string sUserAgent);
  ~CurlHttpClient() override;

  common::HttpResponse get(const std::string& sUrl) override;
  common::HttpResponse post(const std::string& sUrl, const std::string& sBody,
                            const std::string& sContentType) override;

 private:
  common::HttpResponse perform(const std::string& sUrl, const std::string* pBody,
                               const std::string& sContentType);

  std::string _sUserAgent;
};

}  // namespace ddns::net
