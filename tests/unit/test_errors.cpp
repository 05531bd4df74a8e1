#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace ddns::common;

TEST(ErrorsTest, AppErrorCarriesExitCodeAndCode) {
  AppError err(4, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iExitCode, 4);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ConfigErrorExitsWithTwo) {
  ConfigError err("config_missing", "Cannot open config file: config.json");
  EXPECT_EQ(err._iExitCode, 2);
  EXPECT_EQ(err._sErrorCode, "config_missing");
}

TEST(ErrorsTest, NetworkErrorExitsWithThree) {
  NetworkError err("ip_lookup_failed", "Connection refused");
  EXPECT_EQ(err._iExitCode, 3);
  EXPECT_EQ(err._sErrorCode, "ip_lookup_failed");
}

TEST(ErrorsTest, PolymorphicCatchAsAppError) {
  try {
    throw ConfigError("test", "test message");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iExitCode, 2);
    EXPECT_EQ(err._sErrorCode, "test");
    EXPECT_STREQ(err.what(), "test message");
  }

  try {
    throw NetworkError("test", "network fail");
  } catch (const AppError& err) {
    EXPECT_EQ(err._iExitCode, 3);
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw NetworkError("nf", "unreachable");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "unreachable");
  }
}
