// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <tbscc/data/spin_array.hpp>
#include <vector>

namespace tbscc::data {

/**
 * @brief Chemical species: shell structure and spin coupling constants
 *
 * A shell of angular momentum l carries 2l+1 orbitals. spin_coupling is the
 * symmetric shell x shell matrix W of on-site spin coupling constants.
 */
struct Species {
  std::string name;
  std::vector<int> angular_momenta;
  Eigen::MatrixXd spin_coupling;

  size_t num_shells() const { return angular_momenta.size(); }

  /// Total number of orbitals over all shells
  size_t num_orbitals() const;

  /// Shell index of every orbital of the species, orbitals in shell order
  std::vector<size_t> shell_of_orbital() const;
};

/**
 * @class OrbitalLayout
 * @brief Immutable mapping between orbitals, shells, atoms and species
 *
 * Orbital resolved arrays are shaped (max_orbitals(), num_atoms(), spin) and
 * shell resolved arrays (max_shells(), num_atoms(), spin); slots beyond an
 * atom's own orbital or shell count are padding and stay zero. Dense matrices
 * (Hamiltonian, overlap, eigenvectors) order orbitals atom by atom, starting
 * at orbital_offset(atom).
 */
class OrbitalLayout {
 public:
  /**
   * @brief Construct and validate a layout
   * @param species Species table
   * @param atom_species Species index of every atom
   * @throws ConfigurationError for empty systems, invalid species indices,
   * negative angular momenta or malformed spin coupling matrices
   */
  OrbitalLayout(std::vector<Species> species, std::vector<size_t> atom_species);

  size_t num_atoms() const { return _atom_species.size(); }
  size_t num_species() const { return _species.size(); }

  /// Total number of orbitals (dimension of dense matrices)
  size_t num_orbitals() const { return _num_orbitals; }

  /// Largest shell count of any species
  size_t max_shells() const { return _max_shells; }

  /// Largest orbital count of any species
  size_t max_orbitals() const { return _max_orbitals; }

  const std::vector<Species>& species() const { return _species; }
  const std::vector<size_t>& atom_species() const { return _atom_species; }

  const Species& species_of_atom(size_t atom) const;
  size_t num_orbitals_on_atom(size_t atom) const;
  size_t num_shells_on_atom(size_t atom) const;
  size_t orbital_offset(size_t atom) const;

  /// Shell index of orbital orb of species sp
  size_t shell_of_orbital(size_t sp, size_t orb) const;

  /// Zero array shaped (max_orbitals, num_atoms, num_spin)
  SpinResolvedArray make_orbital_array(size_t num_spin) const;

  /// Zero array shaped (max_shells, num_atoms, num_spin)
  SpinResolvedArray make_shell_array(size_t num_spin) const;

  bool is_orbital_array(const SpinResolvedArray& array) const;
  bool is_shell_array(const SpinResolvedArray& array) const;

  /**
   * @brief Sum orbital resolved values into their shells
   * @throws ConfigurationError if the input is not an orbital array
   */
  SpinResolvedArray shell_sum(const SpinResolvedArray& per_orbital) const;

  /**
   * @brief Copy every shell value onto each orbital of the shell
   * @throws ConfigurationError if the input is not a shell array
   */
  SpinResolvedArray shell_to_orbital(const SpinResolvedArray& per_shell) const;

  /**
   * @brief Dense orbital vector of one spin channel of an orbital array
   */
  Eigen::VectorXd flatten(const SpinResolvedArray& per_orbital,
                          size_t spin) const;

  /**
   * @brief Write a dense orbital vector into one spin channel
   */
  void unflatten(const Eigen::VectorXd& dense, size_t spin,
                 SpinResolvedArray& per_orbital) const;

  /// Sum of each atom's values over orbitals (or shells) for one channel
  Eigen::VectorXd atom_sum(const SpinResolvedArray& array, size_t spin) const;

 private:
  std::vector<Species> _species;
  std::vector<size_t> _atom_species;
  std::vector<std::vector<size_t>> _shell_of_orbital;
  std::vector<size_t> _orbital_offsets;
  size_t _num_orbitals = 0;
  size_t _max_shells = 0;
  size_t _max_orbitals = 0;
};

/**
 * @brief Static electronic model the SCC loop runs on
 *
 * hamiltonian0 is the non-self-consistent (reference) Hamiltonian and overlap
 * the orbital overlap, both num_orbitals x num_orbitals and symmetric.
 */
struct TightBindingModel {
  OrbitalLayout layout;
  Eigen::MatrixXd hamiltonian0;
  Eigen::MatrixXd overlap;

  /**
   * @brief Check matrix dimensions and symmetry against the layout
   * @throws ConfigurationError on any mismatch
   */
  void validate() const;
};

}  // namespace tbscc::data
