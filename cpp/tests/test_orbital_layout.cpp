// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <tbscc/data/orbital_layout.hpp>
#include <tbscc/utils/errors.hpp>

#include "testing_utilities.hpp"

using namespace tbscc;
using namespace tbscc::data;

class OrbitalLayoutTest : public ::testing::Test {
 protected:
  void SetUp() override { model = testing::sp_s_model(); }

  std::shared_ptr<TightBindingModel> model;
};

TEST_F(OrbitalLayoutTest, Counts) {
  const auto& layout = model->layout;
  EXPECT_EQ(layout.num_atoms(), 2u);
  EXPECT_EQ(layout.num_species(), 2u);
  EXPECT_EQ(layout.num_orbitals(), 5u);
  EXPECT_EQ(layout.max_shells(), 2u);
  EXPECT_EQ(layout.max_orbitals(), 4u);
  EXPECT_EQ(layout.num_orbitals_on_atom(0), 4u);
  EXPECT_EQ(layout.num_shells_on_atom(1), 1u);
  EXPECT_EQ(layout.orbital_offset(1), 4u);
  EXPECT_EQ(layout.shell_of_orbital(0, 0), 0u);
  EXPECT_EQ(layout.shell_of_orbital(0, 3), 1u);
  EXPECT_EQ(layout.species_of_atom(1).name, "H");

  EXPECT_THROW(layout.orbital_offset(2), InvariantViolation);
  EXPECT_THROW(layout.shell_of_orbital(1, 1), InvariantViolation);
}

TEST_F(OrbitalLayoutTest, ShellSumAndBroadcast) {
  const auto& layout = model->layout;
  auto charges = layout.make_orbital_array(2);
  charges(0, 0, 0) = 1.5;
  charges(1, 0, 0) = 0.5;
  charges(2, 0, 0) = 0.6;
  charges(3, 0, 0) = 0.7;
  charges(0, 1, 0) = 0.9;
  charges(1, 0, 1) = 0.2;
  charges(3, 0, 1) = -0.1;

  const auto shells = layout.shell_sum(charges);
  ASSERT_TRUE(layout.is_shell_array(shells));
  EXPECT_DOUBLE_EQ(shells(0, 0, 0), 1.5);
  EXPECT_NEAR(shells(1, 0, 0), 1.8, 1e-14);
  EXPECT_DOUBLE_EQ(shells(0, 1, 0), 0.9);
  EXPECT_EQ(shells(1, 1, 0), 0.0);
  EXPECT_NEAR(shells(1, 0, 1), 0.1, 1e-14);

  const auto orbitals = layout.shell_to_orbital(shells);
  ASSERT_TRUE(layout.is_orbital_array(orbitals));
  EXPECT_NEAR(orbitals(2, 0, 0), 1.8, 1e-14);
  EXPECT_DOUBLE_EQ(orbitals(0, 1, 0), 0.9);
  EXPECT_EQ(orbitals(1, 1, 0), 0.0);

  const Eigen::VectorXd per_atom = layout.atom_sum(charges, 0);
  EXPECT_NEAR(per_atom[0], 3.3, 1e-14);
  EXPECT_DOUBLE_EQ(per_atom[1], 0.9);

  EXPECT_THROW(layout.shell_sum(shells), ConfigurationError);
  EXPECT_THROW(layout.shell_to_orbital(charges), ConfigurationError);
}

TEST_F(OrbitalLayoutTest, FlattenFollowsDenseOrder) {
  const auto& layout = model->layout;
  Eigen::VectorXd dense(5);
  dense << 1.0, 2.0, 3.0, 4.0, 5.0;

  auto charges = layout.make_orbital_array(1);
  layout.unflatten(dense, 0, charges);
  EXPECT_EQ(charges(3, 0, 0), 4.0);
  EXPECT_EQ(charges(0, 1, 0), 5.0);
  EXPECT_EQ(charges(1, 1, 0), 0.0);
  EXPECT_EQ(layout.flatten(charges, 0), dense);

  EXPECT_THROW(layout.unflatten(Eigen::VectorXd::Zero(4), 0, charges),
               ConfigurationError);
}

TEST_F(OrbitalLayoutTest, InvalidLayouts) {
  EXPECT_THROW(OrbitalLayout({}, {0}), ConfigurationError);
  EXPECT_THROW(OrbitalLayout({testing::s_species()}, {}), ConfigurationError);
  EXPECT_THROW(OrbitalLayout({testing::s_species()}, {1}), ConfigurationError);

  Species negative{"X", {-1}, Eigen::MatrixXd::Zero(1, 1)};
  EXPECT_THROW(OrbitalLayout({negative}, {0}), ConfigurationError);

  Species wrong_size{"X", {0, 1}, Eigen::MatrixXd::Zero(1, 1)};
  EXPECT_THROW(OrbitalLayout({wrong_size}, {0}), ConfigurationError);

  Eigen::MatrixXd asymmetric(2, 2);
  asymmetric << -0.03, -0.02, -0.025, -0.023;
  Species not_symmetric{"X", {0, 1}, asymmetric};
  EXPECT_THROW(OrbitalLayout({not_symmetric}, {0}), ConfigurationError);
}

TEST_F(OrbitalLayoutTest, ModelValidation) {
  EXPECT_NO_THROW(model->validate());

  auto asymmetric = *model;
  asymmetric.hamiltonian0(0, 1) = 0.3;
  EXPECT_THROW(asymmetric.validate(), ConfigurationError);

  auto wrong_size = *model;
  wrong_size.overlap = Eigen::MatrixXd::Identity(4, 4);
  EXPECT_THROW(wrong_size.validate(), ConfigurationError);
}
