#pragma once

#include <string>

#include "common/Types.hpp"

namespace ddns::net {

/// Pure abstract interface for blocking HTTP requests.
/// Implementations never throw on transport failure; they return a
/// response with bCompleted == false instead.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  virtual common::HttpResponse get(const std::string& sUrl) = 0;
  virtual common::HttpResponse post(const std::string& sUrl, const std::string& sBody,
                                    const std::string& sContentType) = 0;
};

}  // namespace ddns::net
