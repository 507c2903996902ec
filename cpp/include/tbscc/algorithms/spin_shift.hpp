// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <tbscc/data/orbital_layout.hpp>
#include <tbscc/data/spin_array.hpp>
#include <vector>

namespace tbscc::algorithms {

/**
 * @brief On-site spin contribution to the shell resolved potential
 *
 * For every atom a of species sp and every magnetization component s:
 * shift(l, a, s) = sum over l' of W_sp(l, l') * magnetization(l', a, s).
 *
 * Only magnetization components are passed (one for collinear spin, three
 * for non-collinear); the total charge channel is never part of the input,
 * so the charge row of a full shift built from this stays zero.
 *
 * @param magnetization_per_shell Array shaped (shell, atom, 1 or 3)
 * @param atom_species Species index of every atom
 * @param spin_coupling Symmetric shell x shell coupling matrix per species
 * @return Shift of the same shape as magnetization_per_shell
 * @throws ConfigurationError for a wrong rank, a component count other than
 * 1 or 3, a shell extent smaller than some species' shell count, invalid
 * species indices or coupling matrices of the wrong size
 */
data::SpinResolvedArray build_spin_shift(
    const data::SpinResolvedArray& magnetization_per_shell,
    const std::vector<size_t>& atom_species,
    const std::vector<Eigen::MatrixXd>& spin_coupling);

/**
 * @brief build_spin_shift with species and couplings taken from a layout
 */
data::SpinResolvedArray build_spin_shift(
    const data::SpinResolvedArray& magnetization_per_shell,
    const data::OrbitalLayout& layout);

}  // namespace tbscc::algorithms
