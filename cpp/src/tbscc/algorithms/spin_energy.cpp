// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <tbscc/algorithms/spin_energy.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms {

namespace {

void check_arguments(const data::SpinResolvedArray& charge,
                     const data::SpinResolvedArray& shift) {
  std::string problem;
  if (charge.rank() != 3) {
    problem = "spin energy needs (shell, atom, spin) arrays, got " +
              charge.shape_string();
  } else if (!charge.same_shape(shift)) {
    problem = "charge " + charge.shape_string() + " and shift " +
              shift.shape_string() + " differ in shape";
  } else if (charge.num_spin() < 2 || charge.num_spin() > 4) {
    problem = "spin energy needs 2 to 4 spin channels, got " +
              std::to_string(charge.num_spin());
  }
  if (!problem.empty()) {
    TBSCC_LOGGER().error(problem);
    throw ConfigurationError(problem);
  }
}

}  // namespace

double spin_energy(const data::SpinResolvedArray& charge_per_shell,
                   const data::SpinResolvedArray& shift_per_shell) {
  check_arguments(charge_per_shell, shift_per_shell);
  return charge_per_shell.data().dot(shift_per_shell.data());
}

Eigen::VectorXd spin_energy_per_atom(
    const data::SpinResolvedArray& charge_per_shell,
    const data::SpinResolvedArray& shift_per_shell) {
  check_arguments(charge_per_shell, shift_per_shell);
  const size_t n_shell = charge_per_shell.extent(0);
  const size_t n_atom = charge_per_shell.extent(1);
  Eigen::VectorXd per_atom =
      Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_atom));
  for (size_t s = 0; s < charge_per_shell.num_spin(); ++s) {
    for (size_t atom = 0; atom < n_atom; ++atom) {
      for (size_t l = 0; l < n_shell; ++l) {
        per_atom[static_cast<Eigen::Index>(atom)] +=
            charge_per_shell(l, atom, s) * shift_per_shell(l, atom, s);
      }
    }
  }
  return per_atom;
}

}  // namespace tbscc::algorithms
