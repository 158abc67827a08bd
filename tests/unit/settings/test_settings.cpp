// tests/unit/settings/test_settings.cpp - Settings merge and lookup tests
//
#include <gtest/gtest.h>

#include <stdexcept>

#include "workroot/settings/settings.hpp"

using nlohmann::json;
using namespace workroot::settings;

TEST(DeepExtend, MergesNestedObjects)
{
  json dst = {{"python", {{"analysis", {{"typeCheckingMode", "basic"}, {"autoImport", true}}}}}};
  const json src = {{"python", {{"analysis", {{"typeCheckingMode", "strict"}}}}}};

  deep_extend(dst, src);

  EXPECT_EQ(dst["python"]["analysis"]["typeCheckingMode"], "strict");
  EXPECT_EQ(dst["python"]["analysis"]["autoImport"], true);
}

TEST(DeepExtend, ArraysAndScalarsReplace)
{
  json dst = {{"list", {1, 2, 3}}, {"value", {{"nested", 1}}}};
  deep_extend(dst, json{{"list", {4}}, {"value", 7}});

  EXPECT_EQ(dst["list"], json::array({4}));
  EXPECT_EQ(dst["value"], 7);
}

TEST(DeepExtend, ObjectReplacesScalar)
{
  json dst = {{"a", 1}};
  deep_extend(dst, json{{"a", {{"b", 2}}}});
  EXPECT_EQ(dst["a"]["b"], 2);
}

TEST(DeepExtend, NonObjectDestinationIsReplaced)
{
  json dst = nullptr;
  deep_extend(dst, json{{"k", "v"}});
  EXPECT_EQ(dst, (json{{"k", "v"}}));
}

TEST(DeepExtend, SourcesApplyLeftToRight)
{
  json dst = json::object();
  deep_extend(dst, json{{"a", 1}, {"b", 1}}, json{{"b", 2}}, json{{"c", 3}});
  EXPECT_EQ(dst, (json{{"a", 1}, {"b", 2}, {"c", 3}}));
}

TEST(DeepExtend, RejectsNonObjectSource)
{
  json dst = json::object();
  EXPECT_THROW(deep_extend(dst, json::array()), std::invalid_argument);
  EXPECT_THROW(deep_extend(dst, json(5)), std::invalid_argument);
}

TEST(DeepExtend, SourceIsUntouched)
{
  json dst = json::object();
  const json src = {{"a", {{"b", 1}}}};
  deep_extend(dst, src);
  dst["a"]["b"] = 2;
  EXPECT_EQ(src["a"]["b"], 1);
}

TEST(LookupSection, FindsDottedPath)
{
  const json settings = {{"python", {{"analysis", {{"typeCheckingMode", "basic"}}}}}};

  const auto mode = lookup_section(settings, "python.analysis.typeCheckingMode");
  ASSERT_TRUE(mode.has_value());
  EXPECT_EQ(*mode, "basic");

  const auto analysis = lookup_section(settings, "python.analysis");
  ASSERT_TRUE(analysis.has_value());
  EXPECT_TRUE(analysis->is_object());
  EXPECT_EQ(analysis->size(), 1U);
}

TEST(LookupSection, MissingPartsGiveNothing)
{
  const json settings = {{"python", {{"analysis", 3}}}, {"off", nullptr}};

  EXPECT_FALSE(lookup_section(settings, "rust").has_value());
  EXPECT_FALSE(lookup_section(settings, "python.analysis.mode").has_value());
  EXPECT_FALSE(lookup_section(settings, "off").has_value());
  EXPECT_FALSE(lookup_section(json::array(), "python").has_value());
}

TEST(LookupSection, FalseIsAValueNotAbsence)
{
  const json settings = {{"format", {{"enable", false}}}, {"count", 0}};

  const auto enable = lookup_section(settings, "format.enable");
  ASSERT_TRUE(enable.has_value());
  EXPECT_EQ(*enable, false);

  const auto count = lookup_section(settings, "count");
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 0);
}
