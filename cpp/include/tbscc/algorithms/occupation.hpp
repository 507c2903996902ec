// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <vector>

namespace tbscc::algorithms {

struct Occupations {
  std::vector<Eigen::VectorXd> occupations;  ///< one vector per channel
  double fermi_level = 0.0;
};

/**
 * @brief Aufbau filling of several channels against a common Fermi level
 *
 * Levels of all channels are filled from the bottom, each with at most
 * max_occupation electrons. Levels within degeneracy_tolerance of the first
 * partially filled level share the remaining electrons equally. The Fermi
 * level is the energy of the highest (partially) occupied level, or of the
 * lowest level when no electrons are placed.
 *
 * @param eigenvalues Ascending levels of every channel
 * @param num_electrons Electrons to place
 * @param max_occupation Capacity of one level (2 spin-free, 1 otherwise)
 * @param degeneracy_tolerance Energy window of a degenerate group
 * @throws ConfigurationError for a negative electron count or more electrons
 * than the levels can hold
 */
Occupations fill_aufbau(const std::vector<Eigen::VectorXd>& eigenvalues,
                        double num_electrons, double max_occupation,
                        double degeneracy_tolerance);

}  // namespace tbscc::algorithms
