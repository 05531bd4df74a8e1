#include "core/LivenessReporter.hpp"

#include "FakeHttpClient.hpp"

#include <gtest/gtest.h>

using ddns::core::LivenessReporter;
using ddns::test::FakeHttpClient;

TEST(LivenessReporterTest, PostsMessageToUuidUrl) {
  FakeHttpClient hcFake;
  hcFake.respond("https://hc-ping.com/0b1c2d3e", 200, "OK");

  LivenessReporter lrReporter(hcFake, "https://hc-ping.com/");
  auto hr = lrReporter.ping("0b1c2d3e", "No change");
  EXPECT_TRUE(hr.bCompleted);
  EXPECT_EQ(hr.iStatusCode, 200);

  ASSERT_EQ(hcFake.calls().size(), 1u);
  const auto& call = hcFake.calls()[0];
  EXPECT_EQ(call.sMethod, "POST");
  EXPECT_EQ(call.sUrl, "https://hc-ping.com/0b1c2d3e");
  EXPECT_EQ(call.sBody, "No change");
  EXPECT_EQ(call.sContentType, "text/plain");
}

TEST(LivenessReporterTest, TransportFailureIsReturnedNotThrown) {
  FakeHttpClient hcFake;
  hcFake.fail("https://hc-ping.com/0b1c2d3e", "Could not resolve host");

  LivenessReporter lrReporter(hcFake, "https://hc-ping.com");
  auto hr = lrReporter.ping("0b1c2d3e", "No change");
  EXPECT_FALSE(hr.bCompleted);
  EXPECT_EQ(hr.sErrorMessage, "Could not resolve host");
}
