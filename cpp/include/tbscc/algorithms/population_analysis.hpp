// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <string>

namespace tbscc::algorithms {

/**
 * @class PopulationAnalysis
 * @brief Orbital populations from occupied eigenvectors
 *
 * Populations are returned per orbital in dense orbital order; the SCC
 * driver sums them into shells. Mulliken analysis, for example, returns
 * diag(C f C^T S) for real eigenvectors.
 */
class PopulationAnalysis {
 public:
  virtual ~PopulationAnalysis() = default;

  virtual std::string name() const = 0;

  /**
   * @brief Populations of one collinear spin channel
   * @param eigenvectors N x M eigenvector matrix
   * @param occupations M occupation numbers
   * @param overlap N x N overlap
   * @return N populations
   */
  virtual Eigen::VectorXd populate(const Eigen::MatrixXd& eigenvectors,
                                   const Eigen::VectorXd& occupations,
                                   const Eigen::MatrixXd& overlap) = 0;

  /**
   * @brief Charge and magnetization densities of two-component spinors
   * @param eigenvectors 2N x M spinor coefficients, up block first
   * @param occupations M occupation numbers
   * @param overlap N x N spatial overlap
   * @return N x 4 matrix with columns (q, mx, my, mz)
   */
  virtual Eigen::MatrixXd populate(const Eigen::MatrixXcd& eigenvectors,
                                   const Eigen::VectorXd& occupations,
                                   const Eigen::MatrixXd& overlap) = 0;
};

}  // namespace tbscc::algorithms
