// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <deque>
#include <tbscc/algorithms/mixer.hpp>

namespace tbscc::algorithms::mixers {

/**
 * @brief Pulay DIIS on the residual history
 *
 * Coefficients c with sum(c) = 1 minimise |sum c_i r_i|; the next input is
 * sum c_i (x_i + alpha r_i). When the subspace becomes linearly dependent
 * the oldest entries are dropped until the system is well conditioned.
 */
class DiisMixer : public Mixer {
 public:
  std::string name() const override { return "diis"; }

 protected:
  void _reset_impl() override;
  Eigen::VectorXd _mix_impl(const Eigen::VectorXd& input,
                            const Eigen::VectorXd& residual) override;

 private:
  void delete_oldest_();

  std::deque<Eigen::VectorXd> hist_;
  std::deque<Eigen::VectorXd> errors_;
  Eigen::MatrixXd B_;
};

}  // namespace tbscc::algorithms::mixers
