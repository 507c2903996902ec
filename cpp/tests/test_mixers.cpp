// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <tbscc/algorithms/mixer.hpp>
#include <tbscc/utils/errors.hpp>

#include "testing_utilities.hpp"

using namespace tbscc;
using namespace tbscc::algorithms;

class MixerTest : public ::testing::TestWithParam<std::string> {
 protected:
  void SetUp() override {
    // Symmetric contraction with eigenvalues inside (-1, 1)
    a_ = Eigen::MatrixXd(4, 4);
    a_ << 0.30, 0.10, 0.00, -0.05,  //
        0.10, -0.20, 0.15, 0.00,    //
        0.00, 0.15, 0.45, 0.10,     //
        -0.05, 0.00, 0.10, 0.10;
    b_ = Eigen::VectorXd(4);
    b_ << 1.0, -0.5, 0.25, 2.0;
    fixed_point_ = (Eigen::MatrixXd::Identity(4, 4) - a_).lu().solve(b_);
  }

  Eigen::VectorXd residual(const Eigen::VectorXd& x) const {
    return a_ * x + b_ - x;
  }

  Eigen::MatrixXd a_;
  Eigen::VectorXd b_;
  Eigen::VectorXd fixed_point_;
};

TEST_P(MixerTest, FirstStepIsLinear) {
  auto mixer = MixerFactory::create(GetParam());
  mixer->settings().set("mixing_parameter", 0.3);
  mixer->reset(4);

  const Eigen::VectorXd x = Eigen::VectorXd::Zero(4);
  const Eigen::VectorXd r = residual(x);
  const Eigen::VectorXd next = mixer->mix(x, r);
  EXPECT_LT((next - (x + 0.3 * r)).cwiseAbs().maxCoeff(), 1e-14);
  EXPECT_EQ(mixer->num_steps(), 1u);
}

TEST_P(MixerTest, SolvesLinearFixedPoint) {
  auto mixer = MixerFactory::create(GetParam());
  mixer->settings().set("mixing_parameter", 0.5);
  mixer->reset(4);

  Eigen::VectorXd x = Eigen::VectorXd::Zero(4);
  Eigen::VectorXd r = residual(x);
  size_t steps = 0;
  while (r.cwiseAbs().maxCoeff() > 1e-9 && steps < 200) {
    x = mixer->mix(x, r);
    r = residual(x);
    ++steps;
  }
  EXPECT_LT(r.cwiseAbs().maxCoeff(), 1e-9) << GetParam();
  EXPECT_LT((x - fixed_point_).cwiseAbs().maxCoeff(), 1e-8);
  EXPECT_EQ(mixer->num_steps(), steps);
}

TEST_P(MixerTest, ResetRestartsHistory) {
  auto mixer = MixerFactory::create(GetParam());
  mixer->settings().set("mixing_parameter", 0.4);
  mixer->reset(4);

  Eigen::VectorXd x = Eigen::VectorXd::Constant(4, 0.5);
  for (int i = 0; i < 3; ++i) {
    x = mixer->mix(x, residual(x));
  }

  mixer->reset(4);
  EXPECT_EQ(mixer->num_steps(), 0u);
  const Eigen::VectorXd y = Eigen::VectorXd::Constant(4, -1.0);
  const Eigen::VectorXd next = mixer->mix(y, residual(y));
  EXPECT_LT((next - (y + 0.4 * residual(y))).cwiseAbs().maxCoeff(), 1e-14);
}

TEST_P(MixerTest, DimensionMismatch) {
  auto mixer = MixerFactory::create(GetParam());
  mixer->reset(4);
  EXPECT_EQ(mixer->dimension(), 4u);
  EXPECT_THROW(mixer->mix(Eigen::VectorXd::Zero(3), Eigen::VectorXd::Zero(3)),
               InvariantViolation);
  EXPECT_THROW(mixer->mix(Eigen::VectorXd::Zero(4), Eigen::VectorXd::Zero(5)),
               InvariantViolation);
}

INSTANTIATE_TEST_SUITE_P(AllMixers, MixerTest,
                         ::testing::Values("simple", "anderson", "diis",
                                           "broyden"));

TEST(MixerFactoryTest, Factory) {
  const auto available = MixerFactory::available();
  EXPECT_EQ(available, (std::vector<std::string>{"anderson", "broyden", "diis",
                                                 "simple"}));
  EXPECT_EQ(MixerFactory::create()->name(), "broyden");
  EXPECT_EQ(MixerFactory::create("diis")->name(), "diis");
  EXPECT_THROW(MixerFactory::create("nonexistent_mixer"), std::runtime_error);

  EXPECT_NO_THROW(MixerFactory::register_instance(
      []() -> MixerFactory::return_type {
        return std::make_unique<testing::CountingMixer>();
      }));
  EXPECT_THROW(MixerFactory::register_instance(
                   []() -> MixerFactory::return_type {
                     return std::make_unique<testing::CountingMixer>();
                   }),
               std::runtime_error);
  EXPECT_TRUE(MixerFactory::has("counting"));
  EXPECT_EQ(MixerFactory::create("counting")->name(), "counting");

  EXPECT_TRUE(MixerFactory::unregister_instance("counting"));
  EXPECT_FALSE(MixerFactory::unregister_instance("counting"));
  EXPECT_FALSE(MixerFactory::has("counting"));
}
