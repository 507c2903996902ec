// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <string>

namespace tbscc::algorithms {

/**
 * @brief Eigenpairs of a generalized eigenproblem H C = S C E
 *
 * status is 0 on success; any other value is solver specific and makes the
 * SCC driver stop with a NumericalFailure carrying status and message.
 */
template <typename MatrixType>
struct EigenSolution {
  Eigen::VectorXd eigenvalues;  ///< ascending
  MatrixType eigenvectors;      ///< one column per eigenvalue
  int status = 0;
  std::string message;
};

using RealEigenSolution = EigenSolution<Eigen::MatrixXd>;
using ComplexEigenSolution = EigenSolution<Eigen::MatrixXcd>;

/**
 * @class Eigensolver
 * @brief Dense generalized eigensolver consumed by the SCC driver
 *
 * The real overload serves the spin-free and collinear cases, the complex
 * overload the non-collinear (2N x 2N spinor) case. Implementations report
 * failures through the status field instead of throwing.
 */
class Eigensolver {
 public:
  virtual ~Eigensolver() = default;

  virtual std::string name() const = 0;

  virtual RealEigenSolution solve(const Eigen::MatrixXd& hamiltonian,
                                  const Eigen::MatrixXd& overlap) = 0;

  virtual ComplexEigenSolution solve(const Eigen::MatrixXcd& hamiltonian,
                                     const Eigen::MatrixXcd& overlap) = 0;
};

/**
 * @brief Eigensolver backed by Eigen::GeneralizedSelfAdjointEigenSolver
 *
 * status is the Eigen::ComputationInfo of the decomposition; an overlap
 * that is not positive definite is reported as Eigen::NumericalIssue.
 */
class DenseEigensolver : public Eigensolver {
 public:
  std::string name() const override { return "dense"; }

  RealEigenSolution solve(const Eigen::MatrixXd& hamiltonian,
                          const Eigen::MatrixXd& overlap) override;

  ComplexEigenSolution solve(const Eigen::MatrixXcd& hamiltonian,
                             const Eigen::MatrixXcd& overlap) override;
};

}  // namespace tbscc::algorithms
