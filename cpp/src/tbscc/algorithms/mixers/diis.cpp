// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "diis.hpp"

#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms::mixers {

void DiisMixer::_reset_impl() {
  hist_.clear();
  errors_.clear();
  B_.resize(0, 0);
}

Eigen::VectorXd DiisMixer::_mix_impl(const Eigen::VectorXd& input,
                                     const Eigen::VectorXd& residual) {
  const double alpha = _mixing_parameter();
  if (hist_.size() == _history_size()) delete_oldest_();
  hist_.push_back(input + alpha * residual);
  errors_.push_back(residual);

  const size_t n = hist_.size();
  Eigen::MatrixXd B_old = B_;
  B_ = Eigen::MatrixXd::Zero(n, n);
  if (n > 1) {
    B_.block(0, 0, n - 1, n - 1) = B_old;
  }
  for (size_t i = 0; i < n; ++i) {
    B_(i, n - 1) = B_(n - 1, i) = errors_[i].dot(errors_[n - 1]);
  }

  constexpr double linear_dependence_threshold = 1e-12;
  for (;;) {
    const size_t rank = hist_.size() + 1;
    const double b_max = B_.maxCoeff();
    if (b_max == 0.0 || rank <= 2) {
      return hist_.back();
    }

    Eigen::MatrixXd A(rank, rank);
    A.col(0).setConstant(-1.0);
    A.row(0).setConstant(-1.0);
    A(0, 0) = 0.0;
    A.block(1, 1, rank - 1, rank - 1) = B_ / b_max;
    Eigen::VectorXd rhs = Eigen::VectorXd::Zero(rank);
    rhs[0] = -1.0;

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr = A.colPivHouseholderQr();
    if (qr.absDeterminant() < linear_dependence_threshold) {
      TBSCC_LOGGER().debug("DIIS subspace of {} is linearly dependent",
                           hist_.size());
      delete_oldest_();
      continue;
    }
    const Eigen::VectorXd c = qr.solve(rhs);
    Eigen::VectorXd next = Eigen::VectorXd::Zero(input.size());
    for (size_t i = 0; i < hist_.size(); ++i) {
      next += c[static_cast<Eigen::Index>(i + 1)] * hist_[i];
    }
    return next;
  }
}

void DiisMixer::delete_oldest_() {
  if (hist_.empty()) return;
  hist_.pop_front();
  errors_.pop_front();
  const auto sz = B_.rows();
  if (sz > 1) {
    Eigen::MatrixXd tmp = B_.block(1, 1, sz - 1, sz - 1);
    B_ = tmp;
  } else {
    B_.resize(0, 0);
  }
}

}  // namespace tbscc::algorithms::mixers
