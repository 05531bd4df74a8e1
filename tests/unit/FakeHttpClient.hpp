#pragma once

#include "net/IHttpClient.hpp"

#include <map>
#include <string>
#include <vector>

namespace ddns::test {

/// Scripted IHttpClient. Responses are keyed by URL; unscripted URLs
/// behave like an unreachable host.
class FakeHttpClient : public net::IHttpClient {
 public:
  struct Call {
    std::string sMethod;
    std::string sUrl;
    std::string sBody;
    std::string sContentType;
  };

  void respond(const std::string& sUrl, long iStatus, const std::string& sBody = {}) {
    common::HttpResponse hr;
    hr.bCompleted = true;
    hr.iStatusCode = iStatus;
    hr.sBody = sBody;
    _mResponses[sUrl] = hr;
  }

  void fail(const std::string& sUrl, const std::string& sError) {
    common::HttpResponse hr;
    hr.sErrorMessage = sError;
    _mResponses[sUrl] = hr;
  }

  common::HttpResponse get(const std::string& sUrl) override {
    _vCalls.push_back({"GET", sUrl, {}, {}});
    return lookup(sUrl);
  }

  common::HttpResponse post(const std::string& sUrl, const std::string& sBody,
                            const std::string& sContentType) override {
    _vCalls.push_back({"POST", sUrl, sBody, sContentType});
    return lookup(sUrl);
  }

  const std::vector<Call>& calls() const { return _vCalls; }

  int countCalls(const std::string& sUrl) const {
    int iCount = 0;
    for (const auto& call : _vCalls) {
      if (call.sUrl == sUrl) ++iCount;
    }
    return iCount;
  }

 private:
  common::HttpResponse lookup(const std::string& sUrl) const {
    auto it = _mResponses.find(sUrl);
    if (it == _mResponses.end()) {
      common::HttpResponse hr;
      hr.sErrorMessage = "Couldn't resolve host name";
      return hr;
    }
    return it->second;
  }

  std::map<std::string, common::HttpResponse> _mResponses;
  std::vector<Call> _vCalls;
};

}  // namespace ddns::test
