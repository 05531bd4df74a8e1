#include "providers/PorkbunProvider.hpp"

#include "FakeHttpClient.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using ddns::common::DnsRecord;
using ddns::common::PushStatus;
using ddns::providers::PorkbunProvider;
using ddns::security::ApiCredentials;
using ddns::test::FakeHttpClient;

static const std::string kApiBase = "https://api-ipv4.porkbun.com/api/json/v3";
static const std::string kEditUrl =
    "https://api-ipv4.porkbun.com/api/json/v3/dns/editByNameType/home.example.com/A/";

namespace {

DnsRecord makeRecord(const std::string& sIp) {
  DnsRecord dr;
  dr.sType = "A";
  dr.uTtl = 600;
  dr.sValue = sIp;
  return dr;
}

}  // namespace

TEST(PorkbunProviderTest, BuildsEditByNameTypeUrl) {
  FakeHttpClient hcFake;
  PorkbunProvider ppProvider(hcFake, kApiBase + "/");
  EXPECT_EQ(ppProvider.editUrl("home.example.com", "A"), kEditUrl);
  EXPECT_EQ(ppProvider.name(), "porkbun");
}

TEST(PorkbunProviderTest, PostsCredentialsContentAndTtl) {
  FakeHttpClient hcFake;
  hcFake.respond(kEditUrl, 200, R"({"status":"SUCCESS"})");

  PorkbunProvider ppProvider(hcFake, kApiBase);
  ApiCredentials acCreds("pk1_abc", "sk1_def");
  auto prs = ppProvider.updateRecord(acCreds, "home.example.com", makeRecord("5.6.7.8"));
  EXPECT_EQ(prs.status, PushStatus::Applied);
  EXPECT_EQ(prs.iStatusCode, 200);

  ASSERT_EQ(hcFake.calls().size(), 1u);
  const auto& call = hcFake.calls()[0];
  EXPECT_EQ(call.sMethod, "POST");
  EXPECT_EQ(call.sContentType, "application/json");

  auto jBody = nlohmann::json::parse(call.sBody);
  EXPECT_EQ(jBody["apikey"], "pk1_abc");
  EXPECT_EQ(jBody["secretapikey"], "sk1_def");
  EXPECT_EQ(jBody["content"], "5.6.7.8");
  EXPECT_EQ(jBody["ttl"], 600);
}

TEST(PorkbunProviderTest, NonOkStatusIsRejected) {
  FakeHttpClient hcFake;
  hcFake.respond(kEditUrl, 400, R"({"status":"ERROR","message":"Edit error: We were unable to edit the DNS record."})");

  PorkbunProvider ppProvider(hcFake, kApiBase);
  ApiCredentials acCreds("pk1", "sk1");
  auto prs = ppProvider.updateRecord(acCreds, "home.example.com", makeRecord("5.6.7.8"));
  EXPECT_EQ(prs.status, PushStatus::Rejected);
  EXPECT_EQ(prs.iStatusCode, 400);
  EXPECT_NE(prs.sErrorMessage.find("unable to edit"), std::string::npos);
}

TEST(PorkbunProviderTest, OtherSuccessCodesAreStillRejected) {
  FakeHttpClient hcFake;
  hcFake.respond(kEditUrl, 204);

  PorkbunProvider ppProvider(hcFake, kApiBase);
  ApiCredentials acCreds("pk1", "sk1");
  auto prs = ppProvider.updateRecord(acCreds, "home.example.com", makeRecord("5.6.7.8"));
  EXPECT_EQ(prs.status, PushStatus::Rejected);
}

TEST(PorkbunProviderTest, TransportFailureIsUnreachable) {
  FakeHttpClient hcFake;
  hcFake.fail(kEditUrl, "SSL connect error");

  PorkbunProvider ppProvider(hcFake, kApiBase);
  ApiCredentials acCreds("pk1", "sk1");
  auto prs = ppProvider.updateRecord(acCreds, "home.example.com", makeRecord("5.6.7.8"));
  EXPECT_EQ(prs.status, PushStatus::Unreachable);
  EXPECT_EQ(prs.sErrorMessage, "SSL connect error");
}
