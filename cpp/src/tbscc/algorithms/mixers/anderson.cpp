// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "anderson.hpp"

#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms::mixers {

void AndersonMixer::_reset_impl() {
  dx_.clear();
  df_.clear();
  last_input_.resize(0);
  last_residual_.resize(0);
}

Eigen::VectorXd AndersonMixer::_mix_impl(const Eigen::VectorXd& input,
                                         const Eigen::VectorXd& residual) {
  const double alpha = _mixing_parameter();
  Eigen::VectorXd next = input + alpha * residual;

  if (last_input_.size() > 0) {
    if (dx_.size() == _history_size()) {
      dx_.pop_front();
      df_.pop_front();
    }
    dx_.push_back(input - last_input_);
    df_.push_back(residual - last_residual_);

    const auto n = static_cast<Eigen::Index>(df_.size());
    Eigen::MatrixXd gram(n, n);
    Eigen::VectorXd rhs(n);
    for (Eigen::Index i = 0; i < n; ++i) {
      for (Eigen::Index j = 0; j <= i; ++j) {
        gram(i, j) = gram(j, i) = df_[i].dot(df_[j]);
      }
      rhs[i] = df_[i].dot(residual);
    }

    Eigen::LDLT<Eigen::MatrixXd> ldlt(gram);
    if (ldlt.info() == Eigen::Success && ldlt.isPositive() &&
        ldlt.vectorD().minCoeff() > 1e-14 * ldlt.vectorD().maxCoeff()) {
      const Eigen::VectorXd h = ldlt.solve(rhs);
      for (Eigen::Index i = 0; i < n; ++i) {
        next -= h[i] * (dx_[i] + alpha * df_[i]);
      }
    } else {
      // Singular subspace: keep only the newest pair
      TBSCC_LOGGER().debug("Anderson history of {} is singular, restarting",
                           n);
      dx_.erase(dx_.begin(), dx_.end() - 1);
      df_.erase(df_.begin(), df_.end() - 1);
    }
  }

  last_input_ = input;
  last_residual_ = residual;
  return next;
}

}  // namespace tbscc::algorithms::mixers
