// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <deque>
#include <tbscc/algorithms/mixer.hpp>

namespace tbscc::algorithms::mixers {

/**
 * @brief Anderson mixing (type II multisecant update)
 *
 * With dX and dF the differences of successive inputs and residuals, the
 * coefficients h minimise |r - dF h| and the next input is
 * x + alpha r - (dX + alpha dF) h.
 */
class AndersonMixer : public Mixer {
 public:
  std::string name() const override { return "anderson"; }

 protected:
  void _reset_impl() override;
  Eigen::VectorXd _mix_impl(const Eigen::VectorXd& input,
                            const Eigen::VectorXd& residual) override;

 private:
  std::deque<Eigen::VectorXd> dx_;
  std::deque<Eigen::VectorXd> df_;
  Eigen::VectorXd last_input_;
  Eigen::VectorXd last_residual_;
};

}  // namespace tbscc::algorithms::mixers
