#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "tools/SchemaValidator.h"

namespace {
nlohmann::json readFileSchema() {
  return {
    {"type", "object"},
    {"properties", {
      {"path", {{"type", "string"}}},
      {"encoding", {{"type", "string"}, {"default", "utf-8"}}},
      {"startLine", {{"type", "integer"}, {"default", -1}}},
      {"mode", {{"type", "string"}, {"enum", {"fast", "slow"}}}}
    }},
    {"required", {"path"}}
  };
}
}

TEST(SchemaValidator, FillsDefaults) {
  auto res = SchemaValidator::validate(readFileSchema(), {{"path", "a.txt"}});
  ASSERT_TRUE(res.valid) << res.error;
  EXPECT_EQ(res.args["encoding"], "utf-8");
  EXPECT_EQ(res.args["startLine"], -1);
  EXPECT_FALSE(res.args.contains("mode"));
}

TEST(SchemaValidator, NullArgumentsCountAsEmpty) {
  auto res = SchemaValidator::validate(readFileSchema(), nullptr);
  EXPECT_FALSE(res.valid);
  EXPECT_EQ(res.field, "path");
  EXPECT_EQ(res.error, "Missing required parameter: path");
}

TEST(SchemaValidator, ReportsTypeMismatch) {
  auto res = SchemaValidator::validate(readFileSchema(), {{"path", 12}});
  EXPECT_FALSE(res.valid);
  EXPECT_EQ(res.field, "path");
  EXPECT_NE(res.error.find("expected string"), std::string::npos);
}

TEST(SchemaValidator, AcceptsWholeFloatsAsIntegers) {
  auto res = SchemaValidator::validate(readFileSchema(), {{"path", "a"}, {"startLine", 3.0}});
  EXPECT_TRUE(res.valid);
  res = SchemaValidator::validate(readFileSchema(), {{"path", "a"}, {"startLine", 3.5}});
  EXPECT_FALSE(res.valid);
  EXPECT_EQ(res.field, "startLine");
}

TEST(SchemaValidator, RejectsIntegersBeyondLongRange) {
  auto res = SchemaValidator::validate(readFileSchema(), {{"path", "a"}, {"startLine", 1e20}});
  EXPECT_FALSE(res.valid);
  EXPECT_EQ(res.field, "startLine");
  res = SchemaValidator::validate(readFileSchema(), {{"path", "a"}, {"startLine", -1e20}});
  EXPECT_FALSE(res.valid);
  res = SchemaValidator::validate(readFileSchema(),
                                  {{"path", "a"}, {"startLine", 18446744073709551615ULL}});
  EXPECT_FALSE(res.valid);
}

TEST(SchemaValidator, WholeFloatsBecomeIntegers) {
  auto res = SchemaValidator::validate(readFileSchema(), {{"path", "a"}, {"startLine", 7.0}});
  ASSERT_TRUE(res.valid) << res.error;
  EXPECT_TRUE(res.args["startLine"].is_number_integer());
  EXPECT_EQ(res.args["startLine"].get<long>(), 7);
}

TEST(SchemaValidator, EnforcesEnumAndKeepsUnknownKeys) {
  auto res = SchemaValidator::validate(readFileSchema(), {{"path", "a"}, {"mode", "medium"}});
  EXPECT_FALSE(res.valid);
  EXPECT_EQ(res.field, "mode");

  res = SchemaValidator::validate(readFileSchema(), {{"path", "a"}, {"extra", true}});
  ASSERT_TRUE(res.valid);
  EXPECT_EQ(res.args["extra"], true);
}

TEST(SchemaValidator, RejectsNonObjectArguments) {
  auto res = SchemaValidator::validate(readFileSchema(), nlohmann::json::array({1}));
  EXPECT_FALSE(res.valid);
}
