// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cmath>
#include <tbscc/data/orbital_layout.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::data {

namespace {

[[noreturn]] void fail(const std::string& message) {
  TBSCC_LOGGER().error(message);
  throw ConfigurationError(message);
}

}  // namespace

size_t Species::num_orbitals() const {
  size_t n = 0;
  for (int l : angular_momenta) {
    n += static_cast<size_t>(2 * l + 1);
  }
  return n;
}

std::vector<size_t> Species::shell_of_orbital() const {
  std::vector<size_t> result;
  result.reserve(num_orbitals());
  for (size_t sh = 0; sh < angular_momenta.size(); ++sh) {
    const auto degeneracy = static_cast<size_t>(2 * angular_momenta[sh] + 1);
    result.insert(result.end(), degeneracy, sh);
  }
  return result;
}

OrbitalLayout::OrbitalLayout(std::vector<Species> species,
                             std::vector<size_t> atom_species)
    : _species(std::move(species)), _atom_species(std::move(atom_species)) {
  TBSCC_LOG_TRACE_ENTERING();
  if (_species.empty()) fail("Orbital layout needs at least one species");
  if (_atom_species.empty()) fail("Orbital layout needs at least one atom");

  for (const auto& sp : _species) {
    if (sp.angular_momenta.empty()) {
      fail("Species '" + sp.name + "' has no shells");
    }
    for (int l : sp.angular_momenta) {
      if (l < 0) {
        fail("Species '" + sp.name + "' has negative angular momentum " +
             std::to_string(l));
      }
    }
    const auto n = static_cast<Eigen::Index>(sp.num_shells());
    if (sp.spin_coupling.rows() != n || sp.spin_coupling.cols() != n) {
      fail("Spin coupling of species '" + sp.name + "' is " +
           std::to_string(sp.spin_coupling.rows()) + "x" +
           std::to_string(sp.spin_coupling.cols()) + ", expected " +
           std::to_string(n) + "x" + std::to_string(n));
    }
    if (!sp.spin_coupling.isApprox(sp.spin_coupling.transpose())) {
      fail("Spin coupling of species '" + sp.name + "' is not symmetric");
    }
    _shell_of_orbital.push_back(sp.shell_of_orbital());
    _max_shells = std::max(_max_shells, sp.num_shells());
    _max_orbitals = std::max(_max_orbitals, sp.num_orbitals());
  }

  _orbital_offsets.reserve(_atom_species.size());
  for (size_t atom = 0; atom < _atom_species.size(); ++atom) {
    if (_atom_species[atom] >= _species.size()) {
      fail("Atom " + std::to_string(atom) + " has species index " +
           std::to_string(_atom_species[atom]) + ", only " +
           std::to_string(_species.size()) + " species defined");
    }
    _orbital_offsets.push_back(_num_orbitals);
    _num_orbitals += _species[_atom_species[atom]].num_orbitals();
  }
}

const Species& OrbitalLayout::species_of_atom(size_t atom) const {
  if (atom >= num_atoms()) {
    throw InvariantViolation("Atom index " + std::to_string(atom) +
                             " out of range for " +
                             std::to_string(num_atoms()) + " atoms");
  }
  return _species[_atom_species[atom]];
}

size_t OrbitalLayout::num_orbitals_on_atom(size_t atom) const {
  return species_of_atom(atom).num_orbitals();
}

size_t OrbitalLayout::num_shells_on_atom(size_t atom) const {
  return species_of_atom(atom).num_shells();
}

size_t OrbitalLayout::orbital_offset(size_t atom) const {
  if (atom >= num_atoms()) {
    throw InvariantViolation("Atom index " + std::to_string(atom) +
                             " out of range for " +
                             std::to_string(num_atoms()) + " atoms");
  }
  return _orbital_offsets[atom];
}

size_t OrbitalLayout::shell_of_orbital(size_t sp, size_t orb) const {
  if (sp >= _species.size() || orb >= _shell_of_orbital[sp].size()) {
    throw InvariantViolation("Orbital " + std::to_string(orb) +
                             " of species " + std::to_string(sp) +
                             " out of range");
  }
  return _shell_of_orbital[sp][orb];
}

SpinResolvedArray OrbitalLayout::make_orbital_array(size_t num_spin) const {
  return SpinResolvedArray({_max_orbitals, num_atoms()}, num_spin);
}

SpinResolvedArray OrbitalLayout::make_shell_array(size_t num_spin) const {
  return SpinResolvedArray({_max_shells, num_atoms()}, num_spin);
}

bool OrbitalLayout::is_orbital_array(const SpinResolvedArray& array) const {
  return array.leading_shape() ==
         std::vector<size_t>{_max_orbitals, num_atoms()};
}

bool OrbitalLayout::is_shell_array(const SpinResolvedArray& array) const {
  return array.leading_shape() == std::vector<size_t>{_max_shells, num_atoms()};
}

SpinResolvedArray OrbitalLayout::shell_sum(
    const SpinResolvedArray& per_orbital) const {
  if (!is_orbital_array(per_orbital)) {
    fail("Expected an orbital resolved array of shape (" +
         std::to_string(_max_orbitals) + ", " + std::to_string(num_atoms()) +
         ", spin), got " + per_orbital.shape_string());
  }
  auto result = make_shell_array(per_orbital.num_spin());
  const auto n_atoms = static_cast<long>(num_atoms());
  for (size_t s = 0; s < per_orbital.num_spin(); ++s) {
    // Each atom writes only its own column; orbitals are added in order
#pragma omp parallel for schedule(static)
    for (long ia = 0; ia < n_atoms; ++ia) {
      const auto atom = static_cast<size_t>(ia);
      const auto& shells = _shell_of_orbital[_atom_species[atom]];
      for (size_t orb = 0; orb < shells.size(); ++orb) {
        result(shells[orb], atom, s) += per_orbital(orb, atom, s);
      }
    }
  }
  return result;
}

SpinResolvedArray OrbitalLayout::shell_to_orbital(
    const SpinResolvedArray& per_shell) const {
  if (!is_shell_array(per_shell)) {
    fail("Expected a shell resolved array of shape (" +
         std::to_string(_max_shells) + ", " + std::to_string(num_atoms()) +
         ", spin), got " + per_shell.shape_string());
  }
  auto result = make_orbital_array(per_shell.num_spin());
  for (size_t s = 0; s < per_shell.num_spin(); ++s) {
    for (size_t atom = 0; atom < num_atoms(); ++atom) {
      const auto& shells = _shell_of_orbital[_atom_species[atom]];
      for (size_t orb = 0; orb < shells.size(); ++orb) {
        result(orb, atom, s) = per_shell(shells[orb], atom, s);
      }
    }
  }
  return result;
}

Eigen::VectorXd OrbitalLayout::flatten(const SpinResolvedArray& per_orbital,
                                       size_t spin) const {
  if (!is_orbital_array(per_orbital)) {
    fail("Cannot flatten array of shape " + per_orbital.shape_string());
  }
  Eigen::VectorXd dense(static_cast<Eigen::Index>(_num_orbitals));
  for (size_t atom = 0; atom < num_atoms(); ++atom) {
    const size_t offset = _orbital_offsets[atom];
    const size_t n = num_orbitals_on_atom(atom);
    for (size_t orb = 0; orb < n; ++orb) {
      dense[static_cast<Eigen::Index>(offset + orb)] =
          per_orbital(orb, atom, spin);
    }
  }
  return dense;
}

void OrbitalLayout::unflatten(const Eigen::VectorXd& dense, size_t spin,
                              SpinResolvedArray& per_orbital) const {
  if (!is_orbital_array(per_orbital) ||
      static_cast<size_t>(dense.size()) != _num_orbitals) {
    fail("Cannot unflatten a vector of " + std::to_string(dense.size()) +
         " orbitals into shape " + per_orbital.shape_string());
  }
  for (size_t atom = 0; atom < num_atoms(); ++atom) {
    const size_t offset = _orbital_offsets[atom];
    const size_t n = num_orbitals_on_atom(atom);
    for (size_t orb = 0; orb < n; ++orb) {
      per_orbital(orb, atom, spin) =
          dense[static_cast<Eigen::Index>(offset + orb)];
    }
  }
}

Eigen::VectorXd OrbitalLayout::atom_sum(const SpinResolvedArray& array,
                                        size_t spin) const {
  if (array.rank() != 3 || array.extent(1) != num_atoms()) {
    fail("Cannot sum array of shape " + array.shape_string() + " per atom");
  }
  Eigen::VectorXd result =
      Eigen::VectorXd::Zero(static_cast<Eigen::Index>(num_atoms()));
  for (size_t atom = 0; atom < num_atoms(); ++atom) {
    for (size_t i = 0; i < array.extent(0); ++i) {
      result[static_cast<Eigen::Index>(atom)] += array(i, atom, spin);
    }
  }
  return result;
}

void TightBindingModel::validate() const {
  TBSCC_LOG_TRACE_ENTERING();
  const auto n = static_cast<Eigen::Index>(layout.num_orbitals());
  if (hamiltonian0.rows() != n || hamiltonian0.cols() != n) {
    fail("Reference Hamiltonian is " + std::to_string(hamiltonian0.rows()) +
         "x" + std::to_string(hamiltonian0.cols()) + ", layout has " +
         std::to_string(n) + " orbitals");
  }
  if (overlap.rows() != n || overlap.cols() != n) {
    fail("Overlap is " + std::to_string(overlap.rows()) + "x" +
         std::to_string(overlap.cols()) + ", layout has " + std::to_string(n) +
         " orbitals");
  }
  if (!hamiltonian0.isApprox(hamiltonian0.transpose())) {
    fail("Reference Hamiltonian is not symmetric");
  }
  if (!overlap.isApprox(overlap.transpose())) {
    fail("Overlap is not symmetric");
  }
}

}  // namespace tbscc::data
