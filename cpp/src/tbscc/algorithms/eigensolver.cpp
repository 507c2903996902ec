// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <tbscc/algorithms/eigensolver.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms {

namespace {

template <typename MatrixType>
EigenSolution<MatrixType> solve_dense(const MatrixType& hamiltonian,
                                      const MatrixType& overlap) {
  EigenSolution<MatrixType> result;
  if (hamiltonian.rows() != hamiltonian.cols() ||
      overlap.rows() != hamiltonian.rows() ||
      overlap.cols() != hamiltonian.cols()) {
    result.status = static_cast<int>(Eigen::InvalidInput);
    result.message = "Hamiltonian and overlap dimensions differ";
    return result;
  }

  Eigen::LLT<MatrixType> cholesky(overlap);
  if (cholesky.info() != Eigen::Success) {
    result.status = static_cast<int>(cholesky.info());
    result.message = "Overlap matrix is not positive definite";
    return result;
  }

  Eigen::GeneralizedSelfAdjointEigenSolver<MatrixType> solver(
      hamiltonian, overlap, Eigen::ComputeEigenvectors | Eigen::Ax_lBx);
  result.status = static_cast<int>(solver.info());
  if (solver.info() != Eigen::Success) {
    result.message = "Eigenvalue iteration did not converge";
    return result;
  }
  result.eigenvalues = solver.eigenvalues();
  result.eigenvectors = solver.eigenvectors();
  return result;
}

}  // namespace

RealEigenSolution DenseEigensolver::solve(const Eigen::MatrixXd& hamiltonian,
                                          const Eigen::MatrixXd& overlap) {
  TBSCC_LOG_TRACE_ENTERING();
  return solve_dense(hamiltonian, overlap);
}

ComplexEigenSolution DenseEigensolver::solve(
    const Eigen::MatrixXcd& hamiltonian, const Eigen::MatrixXcd& overlap) {
  TBSCC_LOG_TRACE_ENTERING();
  return solve_dense(hamiltonian, overlap);
}

}  // namespace tbscc::algorithms
