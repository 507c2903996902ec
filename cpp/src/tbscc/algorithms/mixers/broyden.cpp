// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "broyden.hpp"

#include <algorithm>
#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms::mixers {

void BroydenMixer::_reset_impl() {
  df_.clear();
  uu_.clear();
  weights_.clear();
  last_input_.resize(0);
  last_residual_.resize(0);
}

double BroydenMixer::weight_(const Eigen::VectorXd& residual) const {
  const double factor = _settings->get<double>("broyden_weight_factor");
  const double min_weight = _settings->get<double>("broyden_min_weight");
  const double max_weight = _settings->get<double>("broyden_max_weight");
  const double norm = residual.norm();
  double w = max_weight;
  if (norm > factor / max_weight) {
    w = factor / norm;
  }
  return std::max(w, min_weight);
}

Eigen::VectorXd BroydenMixer::_mix_impl(const Eigen::VectorXd& input,
                                        const Eigen::VectorXd& residual) {
  const double alpha = _mixing_parameter();
  Eigen::VectorXd next = input + alpha * residual;

  if (last_input_.size() > 0) {
    Eigen::VectorXd df = residual - last_residual_;
    const double df_norm = df.norm();
    if (df_norm > 0.0) {
      if (df_.size() == _history_size()) {
        df_.pop_front();
        uu_.pop_front();
        weights_.pop_front();
      }
      df /= df_norm;
      uu_.push_back(alpha * df + (input - last_input_) / df_norm);
      df_.push_back(std::move(df));
      weights_.push_back(weight_(residual));
    } else {
      TBSCC_LOGGER().debug("Broyden step skipped, residual did not change");
    }

    const auto n = static_cast<Eigen::Index>(df_.size());
    if (n > 0) {
      const double omega0 = _settings->get<double>("broyden_omega0");
      Eigen::VectorXd c(n);
      Eigen::MatrixXd beta(n, n);
      for (Eigen::Index k = 0; k < n; ++k) {
        c[k] = weights_[k] * df_[k].dot(residual);
        for (Eigen::Index l = 0; l <= k; ++l) {
          beta(k, l) = beta(l, k) =
              weights_[k] * weights_[l] * df_[k].dot(df_[l]);
        }
        beta(k, k) += omega0 * omega0;
      }
      const Eigen::VectorXd gamma = beta.ldlt().solve(c);
      for (Eigen::Index k = 0; k < n; ++k) {
        next -= weights_[k] * gamma[k] * uu_[k];
      }
    }
  }

  last_input_ = input;
  last_residual_ = residual;
  return next;
}

}  // namespace tbscc::algorithms::mixers
