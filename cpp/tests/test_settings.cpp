// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cstdint>
#include <diven/data/settings.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "ut_common.hpp"

using namespace diven::data;

class TestSettings : public Settings {
 public:
  TestSettings() {
    set_default("flag", false, "A boolean switch");
    set_default("order", 20, "Number of coefficients",
                BoundConstraint<int64_t>{2, 100});
    set_default("scale", 1.5, "A real factor",
                BoundConstraint<double>{0.0, 10.0});
    set_default("policy", "ignore", "What to do",
                ListConstraint<std::string>{{"ignore", "throw"}});
    set_default("modes", std::vector<int64_t>{0, 1, 2});
    set_default("shifts", std::vector<double>{});
    set_default("labels", std::vector<std::string>{"a"}, std::nullopt,
                std::nullopt, false);
  }
};

class BadConstraintSettings : public Settings {
 public:
  BadConstraintSettings() {
    set_default("name", "x", std::nullopt, BoundConstraint<int64_t>{0, 1});
  }
};

class SettingsTest : public ::testing::Test {
 protected:
  void TearDown() override {
    std::filesystem::remove(testing::temp_path("test.settings.json"));
    std::filesystem::remove(testing::temp_path("test.settings.h5"));
  }

  TestSettings settings;
};

TEST_F(SettingsTest, DefaultsAndTypes) {
  EXPECT_EQ(settings.size(), 7u);
  EXPECT_FALSE(settings.empty());
  EXPECT_FALSE(settings.get<bool>("flag"));
  EXPECT_EQ(settings.get<int64_t>("order"), 20);
  EXPECT_EQ(settings.get<int>("order"), 20);
  EXPECT_EQ(settings.get<size_t>("order"), 20u);
  EXPECT_DOUBLE_EQ(settings.get<double>("scale"), 1.5);
  EXPECT_EQ(settings.get<std::string>("policy"), "ignore");
  EXPECT_EQ(settings.get<std::vector<int>>("modes"),
            (std::vector<int>{0, 1, 2}));
  EXPECT_TRUE(settings.get<std::vector<double>>("shifts").empty());

  EXPECT_EQ(settings.get_type_name("order"), "int64");
  EXPECT_EQ(settings.get_type_name("labels"), "string_array");
  EXPECT_EQ(settings.get_type_name("missing"), "not_found");
  EXPECT_EQ(settings.keys(),
            (std::vector<std::string>{"flag", "labels", "modes", "order",
                                      "policy", "scale", "shifts"}));
}

TEST_F(SettingsTest, SetExistingKeys) {
  settings.set("flag", true);
  settings.set("order", 40);
  settings.set("order", size_t{50});
  settings.set("scale", 2.0);
  settings.set("policy", "throw");
  settings.set("modes", std::vector<int>{4, 5});
  settings.set("shifts", std::vector<double>{0.1, -0.2});

  EXPECT_TRUE(settings.get<bool>("flag"));
  EXPECT_EQ(settings.get<int64_t>("order"), 50);
  EXPECT_DOUBLE_EQ(settings.get<double>("scale"), 2.0);
  EXPECT_EQ(settings.get<std::string>("policy"), "throw");
  EXPECT_EQ(settings.get<std::vector<int64_t>>("modes"),
            (std::vector<int64_t>{4, 5}));
  EXPECT_EQ(settings.get<std::vector<double>>("shifts").size(), 2u);
  EXPECT_TRUE(std::holds_alternative<double>(settings.get("scale")));
}

TEST_F(SettingsTest, Errors) {
  EXPECT_THROW(settings.set("missing", 1), SettingNotFound);
  EXPECT_THROW(settings.get<int64_t>("missing"), SettingNotFound);
  EXPECT_THROW(settings.set("order", 2.5), SettingTypeMismatch);
  EXPECT_THROW(settings.get<std::string>("order"), SettingTypeMismatch);
  EXPECT_THROW(settings.set("order", 1), std::invalid_argument);
  EXPECT_THROW(settings.set("order", 101), std::invalid_argument);
  EXPECT_THROW(settings.set("scale", -0.5), std::invalid_argument);
  EXPECT_THROW(settings.set("policy", "retry"), std::invalid_argument);
  EXPECT_EQ(settings.get<int64_t>("order"), 20);
  EXPECT_THROW(BadConstraintSettings{}, std::invalid_argument);
}

TEST_F(SettingsTest, GetOrDefault) {
  EXPECT_EQ(settings.get_or_default<int64_t>("order", 3), 20);
  EXPECT_EQ(settings.get_or_default<int64_t>("missing", 3), 3);
  EXPECT_EQ(settings.get_or_default<std::string>("order", "x"), "x");
}

TEST_F(SettingsTest, Metadata) {
  EXPECT_TRUE(settings.has_description("order"));
  EXPECT_EQ(settings.get_description("order"), "Number of coefficients");
  EXPECT_FALSE(settings.has_description("modes"));
  EXPECT_THROW(settings.get_description("modes"), SettingNotFound);

  ASSERT_TRUE(settings.has_limits("order"));
  const auto limits = settings.get_limits("order");
  const auto* bound = std::get_if<BoundConstraint<int64_t>>(&limits);
  ASSERT_NE(bound, nullptr);
  EXPECT_EQ(bound->min, 2);
  EXPECT_EQ(bound->max, 100);
  EXPECT_FALSE(settings.has_limits("flag"));

  EXPECT_TRUE(settings.is_documented("order"));
  EXPECT_FALSE(settings.is_documented("labels"));
  EXPECT_THROW(settings.is_documented("missing"), SettingNotFound);
}

TEST_F(SettingsTest, GetAsString) {
  EXPECT_EQ(settings.get_as_string("flag"), "false");
  EXPECT_EQ(settings.get_as_string("order"), "20");
  EXPECT_EQ(settings.get_as_string("policy"), "ignore");
  EXPECT_EQ(settings.get_as_string("modes"), "[0, 1, 2]");
  EXPECT_EQ(settings.get_as_string("labels"), "[\"a\"]");
  EXPECT_THROW(settings.get_as_string("missing"), SettingNotFound);
  EXPECT_NE(settings.get_summary().find("order = 20"), std::string::npos);
}

TEST_F(SettingsTest, UpdateFromStrings) {
  settings.update({{"flag", "yes"},
                   {"order", "30"},
                   {"scale", "0.25"},
                   {"policy", "throw"},
                   {"modes", "[7, 8]"}});
  EXPECT_TRUE(settings.get<bool>("flag"));
  EXPECT_EQ(settings.get<int64_t>("order"), 30);
  EXPECT_DOUBLE_EQ(settings.get<double>("scale"), 0.25);
  EXPECT_EQ(settings.get<std::string>("policy"), "throw");
  EXPECT_EQ(settings.get<std::vector<int>>("modes"), (std::vector<int>{7, 8}));
}

TEST_F(SettingsTest, UpdateIsAllOrNothing) {
  EXPECT_THROW(settings.update({{"order", "30"}, {"flag", "maybe"}}),
               std::runtime_error);
  EXPECT_EQ(settings.get<int64_t>("order"), 20);
  EXPECT_FALSE(settings.get<bool>("flag"));

  EXPECT_THROW(settings.update({{"order", "500"}}), std::runtime_error);
  EXPECT_THROW(settings.update({{"missing", "1"}}), SettingNotFound);
  EXPECT_EQ(settings.get<int64_t>("order"), 20);
}

TEST_F(SettingsTest, UpdateFromSettings) {
  TestSettings other;
  other.set("order", 42);
  other.set("policy", "throw");
  settings.update(other);
  EXPECT_EQ(settings.get<int64_t>("order"), 42);
  EXPECT_EQ(settings.get<std::string>("policy"), "throw");
}

TEST_F(SettingsTest, Locking) {
  TestSettings copy(settings);
  settings.lock();
  EXPECT_TRUE(settings.is_locked());
  EXPECT_THROW(settings.set("order", 30), SettingsAreLocked);
  EXPECT_THROW(settings.update({{"order", "30"}}), SettingsAreLocked);
  EXPECT_EQ(settings.get<int64_t>("order"), 20);

  EXPECT_FALSE(copy.is_locked());
  EXPECT_NO_THROW(copy.set("order", 30));
}

TEST_F(SettingsTest, JsonRoundTripKeepsMetadata) {
  settings.set("order", 33);
  settings.set("shifts", std::vector<double>{0.5});
  const auto j = settings.to_json();
  EXPECT_EQ(j["type"], "settings");
  EXPECT_EQ(j["serialization_version"], "0.1.0");

  auto restored = Settings::from_json(j);
  EXPECT_EQ(restored->size(), settings.size());
  EXPECT_EQ(restored->get<int64_t>("order"), 33);
  EXPECT_EQ(restored->get<std::vector<double>>("shifts"),
            std::vector<double>{0.5});
  EXPECT_EQ(restored->get_type_name("modes"), "int64_array");
  EXPECT_EQ(restored->get_description("scale"), "A real factor");
  EXPECT_FALSE(restored->is_documented("labels"));
  EXPECT_THROW(restored->set("order", 1000), std::invalid_argument);
  EXPECT_THROW(restored->set("policy", "retry"), std::invalid_argument);
}

TEST_F(SettingsTest, JsonFileRoundTrip) {
  const auto path = testing::temp_path("test.settings.json");
  settings.set("policy", "throw");
  settings.to_file(path, "json");
  auto restored = Settings::from_file(path, "json");
  EXPECT_EQ(restored->get<std::string>("policy"), "throw");
  EXPECT_EQ(restored->get<std::vector<std::string>>("labels"),
            std::vector<std::string>{"a"});
}

TEST_F(SettingsTest, Hdf5FileRoundTrip) {
  const auto path = testing::temp_path("test.settings.h5");
  settings.set("flag", true);
  settings.set("scale", 3.25);
  settings.set("modes", std::vector<int>{});
  settings.to_hdf5_file(path);

  auto restored = Settings::from_hdf5_file(path);
  EXPECT_TRUE(restored->get<bool>("flag"));
  EXPECT_DOUBLE_EQ(restored->get<double>("scale"), 3.25);
  EXPECT_EQ(restored->get<int64_t>("order"), 20);
  EXPECT_TRUE(restored->get<std::vector<int64_t>>("modes").empty());
  EXPECT_EQ(restored->get<std::string>("policy"), "ignore");
  EXPECT_EQ(restored->get<std::vector<std::string>>("labels"),
            std::vector<std::string>{"a"});
  EXPECT_TRUE(restored->has_limits("scale"));
}

TEST_F(SettingsTest, FileNameAndFormatValidation) {
  EXPECT_THROW(settings.to_json_file(testing::temp_path("test.json")),
               std::invalid_argument);
  EXPECT_THROW(
      settings.to_json_file(testing::temp_path("test.orbitals.json")),
      std::invalid_argument);
  EXPECT_THROW(settings.to_file(testing::temp_path("test.settings.xml"), "xml"),
               std::invalid_argument);
  EXPECT_THROW(Settings::from_json_file(
                   testing::temp_path("does_not_exist.settings.json")),
               std::runtime_error);
  EXPECT_THROW(Settings::from_json(nlohmann::json::array()),
               std::runtime_error);
}
