// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <tbscc/data/spin_array.hpp>

namespace tbscc::algorithms {

/**
 * @brief Total spin energy, the sum over all elements of charge * shift
 *
 * Only meaningful when the charge channel of the shift is zero, which holds
 * for shifts assembled from build_spin_shift().
 *
 * @param charge_per_shell Array shaped (shell, atom, spin)
 * @param shift_per_shell Array of the same shape
 * @throws ConfigurationError if the shapes differ, the arrays are not rank 3
 * or the spin count is not 2, 3 or 4
 */
double spin_energy(const data::SpinResolvedArray& charge_per_shell,
                   const data::SpinResolvedArray& shift_per_shell);

/**
 * @brief Spin energy per atom, summed over the shell and spin axes
 *
 * The entries add up to spin_energy() of the same arguments.
 */
Eigen::VectorXd spin_energy_per_atom(
    const data::SpinResolvedArray& charge_per_shell,
    const data::SpinResolvedArray& shift_per_shell);

}  // namespace tbscc::algorithms
