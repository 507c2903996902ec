// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <cstdio>
#include <nlohmann/json.hpp>
#include <tbscc/algorithms/mixer.hpp>
#include <tbscc/algorithms/scc.hpp>
#include <tbscc/data/settings.hpp>

using namespace tbscc::data;
using tbscc::algorithms::MixerSettings;
using tbscc::algorithms::SccSettings;

class SettingsTest : public ::testing::Test {
 protected:
  SccSettings settings;
};

TEST_F(SettingsTest, Defaults) {
  EXPECT_EQ(settings.get<int64_t>("spin_channels"), 1);
  EXPECT_EQ(settings.get<size_t>("max_scc_iterations"), 100u);
  EXPECT_DOUBLE_EQ(settings.get<double>("scc_tolerance"), 1e-5);
  EXPECT_EQ(settings.get<std::string>("residual_norm"), "max_abs");
  EXPECT_EQ(settings.get<std::string>("mixer"), "broyden");
  EXPECT_FALSE(settings.get<bool>("convergence_failure_is_fatal"));
  EXPECT_TRUE(settings.get_description("scc_tolerance").has_value());
}

TEST_F(SettingsTest, SetAndGet) {
  settings.set("spin_channels", 2);
  settings.set("num_electrons", 8.0);
  settings.set("mixer", "anderson");
  EXPECT_EQ(settings.get<int>("spin_channels"), 2);
  EXPECT_DOUBLE_EQ(settings.get<double>("num_electrons"), 8.0);
  EXPECT_EQ(settings.get<std::string>("mixer"), "anderson");
}

TEST_F(SettingsTest, Constraints) {
  EXPECT_THROW(settings.set("spin_channels", 3), std::out_of_range);
  EXPECT_THROW(settings.set("scc_tolerance", -1.0), std::out_of_range);
  EXPECT_THROW(settings.set("residual_norm", "l1"), std::out_of_range);
  EXPECT_THROW(settings.set("mixer", "no_such_mixer"), std::out_of_range);
  EXPECT_EQ(settings.get<int64_t>("spin_channels"), 1);

  MixerSettings mixer_settings;
  EXPECT_THROW(mixer_settings.set("mixing_parameter", 1.5), std::out_of_range);
  EXPECT_THROW(mixer_settings.set("history_size", 0), std::out_of_range);
}

TEST_F(SettingsTest, UnknownKeyAndTypeMismatch) {
  EXPECT_THROW(settings.set("no_such_key", 1), SettingNotFound);
  EXPECT_THROW(settings.get<double>("no_such_key"), SettingNotFound);
  EXPECT_THROW(settings.set("scc_tolerance", std::string("small")),
               SettingTypeMismatch);
  EXPECT_THROW(settings.get<std::string>("scc_tolerance"),
               SettingTypeMismatch);
  EXPECT_THROW(settings.get<size_t>("num_electrons"), SettingTypeMismatch);
  EXPECT_DOUBLE_EQ(settings.get_or_default<double>("no_such_key", 3.0), 3.0);
}

TEST_F(SettingsTest, Lock) {
  EXPECT_FALSE(settings.is_locked());
  settings.lock();
  EXPECT_TRUE(settings.is_locked());
  EXPECT_THROW(settings.set("max_scc_iterations", 5), SettingsAreLocked);
  EXPECT_EQ(settings.get<int64_t>("max_scc_iterations"), 100);
}

TEST_F(SettingsTest, UpdateIsAtomic) {
  EXPECT_THROW(settings.update(std::map<std::string, SettingValue>{
                   {"max_scc_iterations", int64_t{7}},
                   {"spin_channels", int64_t{3}}}),
               std::out_of_range);
  EXPECT_EQ(settings.get<int64_t>("max_scc_iterations"), 100);

  settings.update(nlohmann::json{{"max_scc_iterations", 7},
                                 {"residual_norm", "l2"}});
  EXPECT_EQ(settings.get<int64_t>("max_scc_iterations"), 7);
  EXPECT_EQ(settings.get<std::string>("residual_norm"), "l2");
}

TEST_F(SettingsTest, JsonRoundTrip) {
  settings.set("num_electrons", 4.0);
  const auto json = settings.to_json();
  EXPECT_DOUBLE_EQ(json["num_electrons"].get<double>(), 4.0);
  EXPECT_EQ(json["mixer"].get<std::string>(), "broyden");

  const std::string filename = "test_settings.settings.json";
  settings.to_json_file(filename);
  auto restored = Settings::from_json_file(filename);
  std::remove(filename.c_str());
  EXPECT_DOUBLE_EQ(restored->get<double>("num_electrons"), 4.0);
  EXPECT_EQ(restored->get<int64_t>("spin_channels"), 1);
  EXPECT_EQ(restored->get<std::string>("residual_norm"), "max_abs");
}
