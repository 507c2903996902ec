// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <tbscc/data/equivalence_map.hpp>
#include <tbscc/data/orbital_layout.hpp>

namespace tbscc::algorithms {

/**
 * @brief Classify orbitals into shell-wise equivalence classes
 *
 * In the first spin channel the atoms are visited in order and every shell
 * of every atom receives its own id, shared by all orbitals of that shell.
 * Ids start at 1 and are never reused. Each further channel repeats the
 * first channel's pattern shifted by the largest id assigned so far, so the
 * same orbital in two channels always lands in two different classes.
 * Padding slots beyond an atom's orbital count stay 0.
 *
 * Two atoms with one s shell each and two spin channels give
 * ids (1, 2) in channel 0 and (3, 4) in channel 1.
 *
 * @param layout Orbital layout of the system
 * @param num_spin Number of spin channels
 * @return Equivalence map shaped (max_orbitals, num_atoms, num_spin)
 * @throws ConfigurationError if num_spin is not 1, 2 or 4
 */
data::EquivalenceMap build_orbital_equivalence(
    const data::OrbitalLayout& layout, size_t num_spin);

}  // namespace tbscc::algorithms
