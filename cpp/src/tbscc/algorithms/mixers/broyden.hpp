// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <deque>
#include <tbscc/algorithms/mixer.hpp>

namespace tbscc::algorithms::mixers {

/**
 * @brief Modified Broyden mixing (D. D. Johnson, PRB 38, 12807 (1988))
 *
 * Every previous iteration i contributes a normalised residual difference
 * dF_i and an update vector u_i = alpha dF_i + dX_i, weighted by
 * w_i = weight_factor / |r_i| clamped to [min_weight, max_weight]. The next
 * input is
 *
 *   x + alpha r - sum_i w_i gamma_i u_i,
 *   gamma = c^T (omega0^2 I + A)^-1,
 *
 * with c_k = w_k dF_k . r and A_kl = w_k w_l dF_k . dF_l.
 */
class BroydenMixer : public Mixer {
 public:
  std::string name() const override { return "broyden"; }

 protected:
  void _reset_impl() override;
  Eigen::VectorXd _mix_impl(const Eigen::VectorXd& input,
                            const Eigen::VectorXd& residual) override;

 private:
  double weight_(const Eigen::VectorXd& residual) const;

  std::deque<Eigen::VectorXd> df_;
  std::deque<Eigen::VectorXd> uu_;
  std::deque<double> weights_;
  Eigen::VectorXd last_input_;
  Eigen::VectorXd last_residual_;
};

}  // namespace tbscc::algorithms::mixers
