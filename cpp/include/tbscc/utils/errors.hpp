// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tbscc {

/**
 * @brief Invalid input detected before any computation starts
 *
 * Raised for unsupported spin-channel counts, array shapes that do not match
 * the orbital layout, inconsistent model matrices and similar set-up errors.
 */
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::invalid_argument(what) {}
};

/**
 * @brief SCC iterations exhausted with the residual above tolerance
 *
 * Only thrown when the caller asked for non-convergence to be fatal; the
 * default policy reports the condition through the result state instead.
 */
class ConvergenceFailure : public std::runtime_error {
 public:
  ConvergenceFailure(double residual, size_t iterations)
      : std::runtime_error("SCC not converged after " +
                           std::to_string(iterations) +
                           " iterations, residual " +
                           std::to_string(residual)),
        _residual(residual),
        _iterations(iterations) {}

  double residual() const { return _residual; }
  size_t iterations() const { return _iterations; }

 private:
  double _residual;
  size_t _iterations;
};

/**
 * @brief The eigensolver reported a non-zero status
 */
class NumericalFailure : public std::runtime_error {
 public:
  NumericalFailure(int status, size_t iteration, const std::string& detail)
      : std::runtime_error("Eigensolver failed with status " +
                           std::to_string(status) + " in SCC iteration " +
                           std::to_string(iteration) +
                           (detail.empty() ? "" : ": " + detail)),
        _status(status),
        _iteration(iteration) {}

  int status() const { return _status; }
  size_t iteration() const { return _iteration; }

 private:
  int _status;
  size_t _iteration;
};

/**
 * @brief Internal consistency check failed (index or size out of range)
 */
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what)
      : std::logic_error(what) {}
};

}  // namespace tbscc
