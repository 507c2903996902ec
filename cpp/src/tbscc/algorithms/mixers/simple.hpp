// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <tbscc/algorithms/mixer.hpp>

namespace tbscc::algorithms::mixers {

/**
 * @brief Linear mixing, x + alpha r
 */
class SimpleMixer : public Mixer {
 public:
  std::string name() const override { return "simple"; }

 protected:
  void _reset_impl() override {}
  Eigen::VectorXd _mix_impl(const Eigen::VectorXd& input,
                            const Eigen::VectorXd& residual) override {
    return input + _mixing_parameter() * residual;
  }
};

}  // namespace tbscc::algorithms::mixers
