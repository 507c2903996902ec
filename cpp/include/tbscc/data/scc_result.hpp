// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <tbscc/data/equivalence_map.hpp>
#include <tbscc/data/spin_array.hpp>
#include <vector>

namespace tbscc::data {

/**
 * @brief Lifecycle of an SCC run
 *
 * init -> iterating -> {converged, max_iter_reached, diag_failed, aborted};
 * the last four are terminal.
 */
enum class SccState {
  init,
  iterating,
  converged,
  max_iter_reached,
  diag_failed,
  aborted
};

std::string to_string(SccState state);

/**
 * @brief Parse a state name produced by to_string()
 * @throws std::invalid_argument for an unknown name
 */
SccState scc_state_from_string(const std::string& name);

/**
 * @brief Terminal snapshot of an SCC run
 *
 * Orbital resolved arrays are shaped (max_orbitals, atom, spin) and shell
 * resolved arrays (max_shells, atom, spin); all of them except
 * up_down_charges are in the charge/magnetization basis.
 */
struct SccResult {
  SccState state = SccState::init;
  size_t iterations = 0;
  double residual = std::numeric_limits<double>::infinity();
  std::vector<double> residual_history;

  /// Output charges of the last completed iteration (initial guess if none)
  SpinResolvedArray charges;
  /// Input charges of the last completed iteration
  SpinResolvedArray input_charges;
  SpinResolvedArray shell_charges;
  /// Shell shift of the last Hamiltonian: electrostatic in channel 0, spin
  /// in the magnetization channels
  SpinResolvedArray shift;
  /// Spin shift rebuilt from shell_charges; channel 0 is zero
  SpinResolvedArray spin_shift;
  /// charges converted to the up/down basis
  SpinResolvedArray up_down_charges;

  double spin_energy = 0.0;
  Eigen::VectorXd spin_energy_per_atom;

  /// Eigenvalues of the last diagonalization, one vector per eigenproblem
  std::vector<Eigen::VectorXd> eigenvalues;
  double fermi_level = 0.0;

  EquivalenceMap equivalence;

  bool converged() const { return state == SccState::converged; }

  size_t num_spin() const { return charges.num_spin(); }

  /// Sum of the charge channel of charges
  double total_charge() const;

  /// Sum of the z (or collinear) magnetization, zero without spin
  double total_magnetization() const;

  /**
   * @brief Summary without the full arrays
   *
   * Keys: state, iterations, residual, residual_history, num_spin,
   * total_charge, total_magnetization, spin_energy, fermi_level,
   * num_equivalence_classes.
   */
  nlohmann::json to_json() const;

  void to_json_file(const std::string& filename) const;

  /**
   * @brief Store every array with its shape in an HDF5 file
   * @throws std::runtime_error if the file cannot be written
   */
  void to_hdf5_file(const std::string& filename) const;

  /**
   * @brief Load a result written by to_hdf5_file()
   * @throws std::runtime_error if the file cannot be read
   */
  static SccResult from_hdf5_file(const std::string& filename);
};

}  // namespace tbscc::data
