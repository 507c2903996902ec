// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <tbscc/algorithms/orbital_equivalence.hpp>
#include <tbscc/data/equivalence_map.hpp>
#include <tbscc/utils/errors.hpp>

#include "testing_utilities.hpp"

using namespace tbscc;
using namespace tbscc::algorithms;

TEST(OrbitalEquivalenceTest, TwoSAtomsTwoChannels) {
  data::OrbitalLayout layout({testing::s_species()}, {0, 0});
  const auto map = build_orbital_equivalence(layout, 2);

  EXPECT_EQ(map.num_classes(), 4u);
  EXPECT_EQ(map.num_spin(), 2u);
  EXPECT_EQ(map.ids()(0, 0, 0), 1);
  EXPECT_EQ(map.ids()(0, 1, 0), 2);
  EXPECT_EQ(map.ids()(0, 0, 1), 3);
  EXPECT_EQ(map.ids()(0, 1, 1), 4);
}

TEST(OrbitalEquivalenceTest, ShellsShareIdsAndPaddingStaysZero) {
  auto model = testing::sp_s_model();
  const auto map = build_orbital_equivalence(model->layout, 1);
  const auto& ids = map.ids();

  ASSERT_EQ(ids.shape(), (std::vector<size_t>{4, 2, 1}));
  // s shell, then the three p orbitals of the first atom
  EXPECT_EQ(ids(0, 0, 0), 1);
  EXPECT_EQ(ids(1, 0, 0), 2);
  EXPECT_EQ(ids(2, 0, 0), 2);
  EXPECT_EQ(ids(3, 0, 0), 2);
  EXPECT_EQ(ids(0, 1, 0), 3);
  for (size_t mu = 1; mu < 4; ++mu) {
    EXPECT_EQ(ids(mu, 1, 0), 0);
  }
  EXPECT_EQ(map.num_classes(), 3u);
}

TEST(OrbitalEquivalenceTest, FourChannelsNeverShareClasses) {
  auto model = testing::sp_s_model();
  const auto map = build_orbital_equivalence(model->layout, 4);
  const auto& ids = map.ids();

  EXPECT_EQ(map.num_classes(), 12u);
  for (size_t s = 1; s < 4; ++s) {
    EXPECT_EQ(ids(0, 0, s), 1 + 3 * static_cast<int>(s));
    EXPECT_EQ(ids(3, 0, s), 2 + 3 * static_cast<int>(s));
    EXPECT_EQ(ids(0, 1, s), 3 + 3 * static_cast<int>(s));
    EXPECT_EQ(ids(2, 1, s), 0);
  }
}

TEST(OrbitalEquivalenceTest, UnsupportedChannelCount) {
  data::OrbitalLayout layout({testing::s_species()}, {0});
  EXPECT_THROW(build_orbital_equivalence(layout, 3), ConfigurationError);
  EXPECT_THROW(build_orbital_equivalence(layout, 0), ConfigurationError);
}

TEST(EquivalenceMapTest, ReduceAveragesAndExpandBroadcasts) {
  auto model = testing::sp_s_model();
  const auto map = build_orbital_equivalence(model->layout, 1);

  auto charges = model->layout.make_orbital_array(1);
  charges(0, 0, 0) = 1.8;
  charges(1, 0, 0) = 0.6;
  charges(2, 0, 0) = 0.7;
  charges(3, 0, 0) = 0.8;
  charges(0, 1, 0) = 1.1;

  const Eigen::VectorXd reduced = map.reduce(charges);
  ASSERT_EQ(reduced.size(), 3);
  EXPECT_DOUBLE_EQ(reduced[0], 1.8);
  EXPECT_NEAR(reduced[1], 0.7, 1e-14);
  EXPECT_DOUBLE_EQ(reduced[2], 1.1);

  const auto expanded = map.expand(reduced);
  EXPECT_NEAR(expanded(1, 0, 0), 0.7, 1e-14);
  EXPECT_NEAR(expanded(3, 0, 0), 0.7, 1e-14);
  EXPECT_DOUBLE_EQ(expanded(0, 1, 0), 1.1);
  EXPECT_EQ(expanded(2, 1, 0), 0.0);

  // expand(reduce(x)) is a projection
  const auto again = map.expand(map.reduce(expanded));
  EXPECT_LT((again.data() - expanded.data()).cwiseAbs().maxCoeff(), 1e-14);
}

TEST(EquivalenceMapTest, ShapeMismatch) {
  auto model = testing::sp_s_model();
  const auto map = build_orbital_equivalence(model->layout, 2);
  EXPECT_THROW(map.reduce(model->layout.make_orbital_array(1)),
               ConfigurationError);
  EXPECT_THROW(map.expand(Eigen::VectorXd::Zero(5)), ConfigurationError);
}

TEST(EquivalenceMapTest, RejectsMalformedIds) {
  data::SpinIndexArray negative({2, 1}, 1, 1);
  negative(1, 0, 0) = -1;
  EXPECT_THROW(data::EquivalenceMap{negative}, ConfigurationError);

  data::SpinIndexArray gap({2, 1}, 1, 1);
  gap(1, 0, 0) = 3;
  EXPECT_THROW(data::EquivalenceMap{gap}, ConfigurationError);

  data::SpinIndexArray flat({2}, 1, 1);
  EXPECT_THROW(data::EquivalenceMap{flat}, ConfigurationError);
}
