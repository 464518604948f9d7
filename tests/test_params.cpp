// Tests for the device parameter catalog.
#include "eufyErrors.hpp"
#include "eufyParams.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

TEST(ParamCatalogTest, LooksUpByCodeAndName) {
  Eufy::Param::value param;
  ASSERT_TRUE(eufyParams::lookup(2027, param));
  EXPECT_EQ(param, Eufy::Param::DETECT_SWITCH);
  ASSERT_TRUE(eufyParams::lookup(std::string("GUARD_MODE"), param));
  EXPECT_EQ(param, Eufy::Param::GUARD_MODE);
  EXPECT_FALSE(eufyParams::lookup(4242, param));
  EXPECT_FALSE(eufyParams::lookup(std::string("NO_SUCH_PARAM"), param));
  EXPECT_STREQ(eufyParams::getName(Eufy::Param::CAMERA_OFF), "CAMERA_OFF");
}

TEST(ParamCatalogTest, ConvertsBooleans) {
  EXPECT_EQ(eufyParams::load(Eufy::Param::DETECT_SWITCH, "1"), Json::Value(true));
  EXPECT_EQ(eufyParams::load(Eufy::Param::DETECT_SWITCH, "0"), Json::Value(false));
  EXPECT_EQ(eufyParams::dump(Eufy::Param::DETECT_SWITCH, Json::Value(true)), "1");
  EXPECT_EQ(eufyParams::dump(Eufy::Param::CAMERA_PIR, Json::Value(0)), "0");
  EXPECT_THROW(eufyParams::load(Eufy::Param::DETECT_SWITCH, "yes"), Eufy::ParamError);
  EXPECT_THROW(eufyParams::dump(Eufy::Param::DETECT_SWITCH, Json::Value("on")), Eufy::ParamError);
}

TEST(ParamCatalogTest, ConvertsJsonValues) {
  EXPECT_EQ(eufyParams::load(Eufy::Param::GUARD_MODE, "63"), Json::Value(63));
  EXPECT_EQ(eufyParams::dump(Eufy::Param::GUARD_MODE, Json::Value(1)), "1");
  EXPECT_THROW(eufyParams::load(Eufy::Param::GUARD_MODE, "{broken"), Eufy::ParamError);
}

TEST(ParamCatalogTest, ConvertsBase64Json) {
  // {"a":1}
  Json::Value value = eufyParams::load(Eufy::Param::SNOOZE_MODE, "eyJhIjoxfQ==");
  ASSERT_TRUE(value.isObject());
  EXPECT_EQ(value["a"].asInt(), 1);
  EXPECT_EQ(eufyParams::dump(Eufy::Param::SNOOZE_MODE, value), "eyJhIjoxfQ==");
  EXPECT_THROW(eufyParams::load(Eufy::Param::SNOOZE_MODE, "abc"), Eufy::ParamError);
}

TEST(ParamCatalogTest, KeepsStringsVerbatim) {
  EXPECT_EQ(eufyParams::load(Eufy::Param::RTSP_AUTHENTICATION, "user:pass"), Json::Value("user:pass"));
  EXPECT_EQ(eufyParams::dump(Eufy::Param::RTSP_AUTHENTICATION, Json::Value("user:pass")), "user:pass");
}

TEST(ParamCatalogTest, EmptyRawValueIsNull) {
  EXPECT_TRUE(eufyParams::load(Eufy::Param::DETECT_SWITCH, "").isNull());
  EXPECT_TRUE(eufyParams::load(Eufy::Param::GUARD_MODE, "").isNull());
}

TEST(ParamRecordTest, ReadsDeviceParams) {
  Json::Value params = eufytest::ParseJson(
      "[{\"param_type\":2027,\"param_value\":\"1\"},"
      " {\"param_type\":1224,\"param_value\":\"2\"},"
      " {\"param_type\":9999,\"param_value\":\"opaque\"},"
      " {\"param_value\":\"no type\"}]");
  eufyParams record(params);

  EXPECT_EQ(record.size(), 3u);
  EXPECT_TRUE(record.has(Eufy::Param::DETECT_SWITCH));
  EXPECT_EQ(record.get(Eufy::Param::DETECT_SWITCH), Json::Value(true));
  EXPECT_EQ(record.get(Eufy::Param::GUARD_MODE), Json::Value(2));
  EXPECT_TRUE(record.get(Eufy::Param::CAMERA_OFF).isNull());

  std::string raw;
  ASSERT_TRUE(record.getRaw(9999, raw));
  EXPECT_EQ(raw, "opaque");
  EXPECT_FALSE(record.getRaw(1234, raw));
}

TEST(ParamRecordTest, ToleratesMissingList) {
  eufyParams record((Json::Value()));
  EXPECT_EQ(record.size(), 0u);
  EXPECT_FALSE(record.has(Eufy::Param::DETECT_SWITCH));
}
