#include "net/CurlHttpClient.hpp"

#include "common/Errors.hpp"

#include <curl/curl.h>

#include <memory>
#include <utility>

namespace ddns::net {

namespace {

size_t appendBody(char* pData, size_t uSize, size_t uCount, void* pUser) {
  auto* pBody = static_cast<std::string*>(pUser);
  pBody->append(pData, uSize * uCount);
  return uSize * uCount;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

}  // namespace

// ── CurlGlobal ─────────────────────────────────────────────────────────────

CurlGlobal::CurlGlobal() {
  const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK) {
    throw common::NetworkError("curl_init_failed",
                               std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

// ── CurlHttpClient ─────────────────────────────────────────────────────────

CurlHttpClient::CurlHttpClient(std::string sUserAgent) : _sUserAgent(std::move(sUserAgent)) {}

CurlHttpClient::~CurlHttpClient() = default;

common::HttpResponse CurlHttpClient::get(const std::string& sUrl) {
  return perform(sUrl, nullptr, {});
}

common::HttpResponse CurlHttpClient::post(const std::string& sUrl, const std::string& sBody,
                                          const std::string& sContentType) {
  return perform(sUrl, &sBody, sContentType);
}

common::HttpResponse CurlHttpClient::perform(const std::string& sUrl, const std::string* pBody,
                                             const std::string& sContentType) {
  common::HttpResponse hr;

  CurlHandle upCurl(curl_easy_init(), &curl_easy_cleanup);
  if (!upCurl) {
    hr.sErrorMessage = "curl_easy_init failed";
    return hr;
  }

  HeaderList upHeaders(nullptr, &curl_slist_free_all);
  if (!sContentType.empty()) {
    const std::string sHeader = "Content-Type: " + sContentType;
    upHeaders.reset(curl_slist_append(nullptr, sHeader.c_str()));
  }

  CURL* pCurl = upCurl.get();
  curl_easy_setopt(pCurl, CURLOPT_URL, sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_V4);
  curl_easy_setopt(pCurl, CURLOPT_USERAGENT, _sUserAgent.c_str());
  curl_easy_setopt(pCurl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, &appendBody);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &hr.sBody);
  if (upHeaders) {
    curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
  }
  if (pBody != nullptr) {
    curl_easy_setopt(pCurl, CURLOPT_POST, 1L);
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, pBody->c_str());
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(pBody->size()));
  }

  const CURLcode rc = curl_easy_perform(pCurl);
  if (rc != CURLE_OK) {
    hr.sErrorMessage = curl_easy_strerror(rc);
    return hr;
  }

  long iStatus = 0;
  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &iStatus);
  hr.bCompleted = true;
  hr.iStatusCode = iStatus;
  return hr;
}

}  // namespace ddns::net
