// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <tbscc/algorithms/spin_shift.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms {

namespace {

[[noreturn]] void reject(const std::string& message) {
  TBSCC_LOGGER().error(message);
  throw ConfigurationError(message);
}

}  // namespace

data::SpinResolvedArray build_spin_shift(
    const data::SpinResolvedArray& magnetization_per_shell,
    const std::vector<size_t>& atom_species,
    const std::vector<Eigen::MatrixXd>& spin_coupling) {
  TBSCC_LOG_TRACE_ENTERING();
  const auto& q = magnetization_per_shell;
  if (q.rank() != 3) {
    reject("Spin shift needs a (shell, atom, spin) array, got " +
           q.shape_string());
  }
  const size_t n_shell = q.extent(0);
  const size_t n_atom = q.extent(1);
  const size_t n_spin = q.num_spin();
  if (n_atom == 0) reject("Spin shift called for zero atoms");
  if (n_spin != 1 && n_spin != 3) {
    reject("Spin shift takes 1 or 3 magnetization components, got " +
           std::to_string(n_spin));
  }
  if (atom_species.size() != n_atom) {
    reject("Spin shift got " + std::to_string(atom_species.size()) +
           " species indices for " + std::to_string(n_atom) + " atoms");
  }
  for (size_t atom = 0; atom < n_atom; ++atom) {
    const size_t sp = atom_species[atom];
    if (sp >= spin_coupling.size()) {
      reject("Atom " + std::to_string(atom) + " has species index " +
             std::to_string(sp) + " without a spin coupling matrix");
    }
    const auto& w = spin_coupling[sp];
    if (w.rows() != w.cols() || static_cast<size_t>(w.rows()) > n_shell) {
      reject("Spin coupling of species " + std::to_string(sp) + " is " +
             std::to_string(w.rows()) + "x" + std::to_string(w.cols()) +
             ", shell extent is " + std::to_string(n_shell));
    }
  }

  data::SpinResolvedArray shift(q.leading_shape(), n_spin);
  const auto n_atom_omp = static_cast<long>(n_atom);
  for (size_t s = 0; s < n_spin; ++s) {
    // Atoms own disjoint output columns; the l' sum runs in a fixed order
#pragma omp parallel for schedule(static)
    for (long ia = 0; ia < n_atom_omp; ++ia) {
      const auto atom = static_cast<size_t>(ia);
      const auto& w = spin_coupling[atom_species[atom]];
      const auto n = static_cast<size_t>(w.rows());
      for (size_t l = 0; l < n; ++l) {
        double acc = 0.0;
        for (size_t lp = 0; lp < n; ++lp) {
          acc += w(static_cast<Eigen::Index>(l),
                   static_cast<Eigen::Index>(lp)) *
                 q(lp, atom, s);
        }
        shift(l, atom, s) = acc;
      }
    }
  }
  return shift;
}

data::SpinResolvedArray build_spin_shift(
    const data::SpinResolvedArray& magnetization_per_shell,
    const data::OrbitalLayout& layout) {
  std::vector<Eigen::MatrixXd> coupling;
  coupling.reserve(layout.num_species());
  for (const auto& sp : layout.species()) {
    coupling.push_back(sp.spin_coupling);
  }
  return build_spin_shift(magnetization_per_shell, layout.atom_species(),
                          coupling);
}

}  // namespace tbscc::algorithms
