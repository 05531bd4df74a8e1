#pragma once

#include <string>

#include "common/Types.hpp"
#include "net/IHttpClient.hpp"

namespace ddns::core {

/// Looks up the caller's public IPv4 address through a plain-text echo
/// service. The body is trimmed and returned as-is; it is not validated
/// as an address literal.
/// Class abbreviation: ir
class IpResolver {
 public:
  IpResolver(net::IHttpClient& hcClient, std::string sEchoUrl);
  ~IpResolver();

  /// Single GET, no retry. Fails on transport error, non-2xx status,
  /// or an empty body.
  common::ResolveResult resolve();

  /// Strip leading and trailing whitespace (spaces, tabs, CR, LF).
  static std::string trim(const std::string& sText);

 private:
  net::IHttpClient& _hcClient;
  std::string _sEchoUrl;
};

}  // namespace ddns::core
