// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <tbscc/algorithms/occupation.hpp>
#include <tbscc/utils/errors.hpp>

using namespace tbscc;
using namespace tbscc::algorithms;

TEST(OccupationTest, SpinFreeFilling) {
  Eigen::VectorXd levels(4);
  levels << -1.0, -0.5, 0.2, 0.9;
  const auto occ = fill_aufbau({levels}, 5.0, 2.0, 1e-8);

  ASSERT_EQ(occ.occupations.size(), 1u);
  Eigen::VectorXd expected(4);
  expected << 2.0, 2.0, 1.0, 0.0;
  EXPECT_EQ(occ.occupations[0], expected);
  EXPECT_DOUBLE_EQ(occ.fermi_level, 0.2);
}

TEST(OccupationTest, CommonFermiLevelAcrossChannels) {
  Eigen::VectorXd up(3);
  up << -1.0, -0.2, 0.5;
  Eigen::VectorXd down(3);
  down << -0.8, 0.1, 0.6;
  const auto occ = fill_aufbau({up, down}, 3.0, 1.0, 1e-8);

  ASSERT_EQ(occ.occupations.size(), 2u);
  EXPECT_EQ(occ.occupations[0].sum(), 2.0);
  EXPECT_EQ(occ.occupations[1].sum(), 1.0);
  EXPECT_EQ(occ.occupations[0][1], 1.0);
  EXPECT_EQ(occ.occupations[1][1], 0.0);
  EXPECT_DOUBLE_EQ(occ.fermi_level, -0.2);
}

TEST(OccupationTest, DegenerateLevelsShareElectrons) {
  Eigen::VectorXd up(2);
  up << -1.0, 0.3;
  Eigen::VectorXd down(2);
  down << -1.0, 0.3;
  const auto occ = fill_aufbau({up, down}, 3.0, 1.0, 1e-8);

  EXPECT_DOUBLE_EQ(occ.occupations[0][0], 1.0);
  EXPECT_DOUBLE_EQ(occ.occupations[1][0], 1.0);
  EXPECT_DOUBLE_EQ(occ.occupations[0][1], 0.5);
  EXPECT_DOUBLE_EQ(occ.occupations[1][1], 0.5);
}

TEST(OccupationTest, NoElectrons) {
  Eigen::VectorXd levels(2);
  levels << 0.4, -0.1;
  const auto occ = fill_aufbau({levels}, 0.0, 2.0, 1e-8);
  EXPECT_EQ(occ.occupations[0].sum(), 0.0);
  EXPECT_DOUBLE_EQ(occ.fermi_level, -0.1);
}

TEST(OccupationTest, InvalidElectronCount) {
  Eigen::VectorXd levels(2);
  levels << -1.0, 1.0;
  EXPECT_THROW(fill_aufbau({levels}, -1.0, 2.0, 1e-8), ConfigurationError);
  EXPECT_THROW(fill_aufbau({levels}, 4.5, 2.0, 1e-8), ConfigurationError);
  EXPECT_NO_THROW(fill_aufbau({levels}, 4.0, 2.0, 1e-8));
}
