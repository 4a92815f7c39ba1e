/**
 * @file Args_uTest.cpp
 * @brief Unit tests for mountwatch::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using mountwatch::helpers::args::ArgMap;
using mountwatch::helpers::args::parseArgs;
using mountwatch::helpers::args::ParsedArgs;
using mountwatch::helpers::args::parseUnsigned;

namespace {

enum Key : std::uint8_t { KEY_JSON = 0, KEY_COUNT = 1, KEY_PATH = 2 };

ArgMap makeMap(bool pathRequired = false) {
  ArgMap map;
  map[KEY_JSON] = {"--json", 0, false, "json"};
  map[KEY_COUNT] = {"--count", 1, false, "count"};
  map[KEY_PATH] = {"--mounts", 1, pathRequired, "path"};
  return map;
}

} // namespace

/* ----------------------------- parseArgs Tests ----------------------------- */

/** @test Flags and their values are collected by key. */
TEST(ArgsTest, ParsesFlagsAndValues) {
  const std::vector<std::string_view> ARGS = {"--json", "--count", "3"};
  ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(parseArgs(ARGS, makeMap(), pargs, error)) << error;
  EXPECT_EQ(pargs.count(KEY_JSON), 1U);
  ASSERT_EQ(pargs[KEY_COUNT].size(), 1U);
  EXPECT_EQ(pargs[KEY_COUNT][0], "3");
  EXPECT_EQ(pargs.count(KEY_PATH), 0U);
}

/** @test No arguments is valid when nothing is required. */
TEST(ArgsTest, EmptyArgumentList) {
  const std::vector<std::string_view> ARGS;
  ParsedArgs pargs;
  std::string error;
  EXPECT_TRUE(parseArgs(ARGS, makeMap(), pargs, error));
  EXPECT_TRUE(pargs.empty());
}

/** @test Unknown flags are rejected. */
TEST(ArgsTest, RejectsUnknownFlag) {
  const std::vector<std::string_view> ARGS = {"--jsn"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGS, makeMap(), pargs, error));
  EXPECT_NE(error.find("--jsn"), std::string::npos);
}

/** @test A flag missing its value is rejected. */
TEST(ArgsTest, RejectsMissingValue) {
  const std::vector<std::string_view> ARGS = {"--json", "--count"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGS, makeMap(), pargs, error));
  EXPECT_NE(error.find("--count"), std::string::npos);
}

/** @test Required flags must be present. */
TEST(ArgsTest, RejectsMissingRequired) {
  const std::vector<std::string_view> ARGS = {"--json"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGS, makeMap(true), pargs, error));
  EXPECT_NE(error.find("--mounts"), std::string::npos);
}

/** @test A repeated flag keeps its last value. */
TEST(ArgsTest, RepeatedFlagKeepsLast) {
  const std::vector<std::string_view> ARGS = {"--count", "1", "--count", "7"};
  ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(parseArgs(ARGS, makeMap(), pargs, error));
  ASSERT_EQ(pargs[KEY_COUNT].size(), 1U);
  EXPECT_EQ(pargs[KEY_COUNT][0], "7");
}

/* ----------------------------- parseUnsigned Tests ----------------------------- */

/** @test Only whole unsigned decimal tokens convert. */
TEST(ArgsTest, ParseUnsigned) {
  EXPECT_EQ(parseUnsigned("0").value_or(1), 0U);
  EXPECT_EQ(parseUnsigned("250").value_or(0), 250U);
  EXPECT_FALSE(parseUnsigned("").has_value());
  EXPECT_FALSE(parseUnsigned("-1").has_value());
  EXPECT_FALSE(parseUnsigned("12ms").has_value());
  EXPECT_FALSE(parseUnsigned("99999999999999999999999").has_value());
}
