// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <tbscc/algorithms/orbital_equivalence.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms {

data::EquivalenceMap build_orbital_equivalence(
    const data::OrbitalLayout& layout, size_t num_spin) {
  TBSCC_LOG_TRACE_ENTERING();
  if (num_spin != 1 && num_spin != 2 && num_spin != 4) {
    TBSCC_LOGGER().error("Orbital equivalence requested for {} channels",
                         num_spin);
    throw ConfigurationError(
        "Orbital equivalence supports 1, 2 or 4 spin channels, got " +
        std::to_string(num_spin));
  }

  data::SpinIndexArray ids({layout.max_orbitals(), layout.num_atoms()},
                           num_spin, 0);

  int next = 1;
  for (size_t atom = 0; atom < layout.num_atoms(); ++atom) {
    const size_t sp = layout.atom_species()[atom];
    const size_t n_orb = layout.num_orbitals_on_atom(atom);
    for (size_t orb = 0; orb < n_orb; ++orb) {
      ids(orb, atom, 0) =
          next + static_cast<int>(layout.shell_of_orbital(sp, orb));
    }
    next += static_cast<int>(layout.num_shells_on_atom(atom));
  }

  const auto stride = static_cast<Eigen::Index>(ids.spin_stride());
  auto blocks = ids.spin_blocks();
  for (size_t s = 1; s < num_spin; ++s) {
    const int offset =
        blocks.leftCols(static_cast<Eigen::Index>(s)).maxCoeff();
    for (Eigen::Index i = 0; i < stride; ++i) {
      if (blocks(i, 0) != 0) {
        blocks(i, static_cast<Eigen::Index>(s)) = blocks(i, 0) + offset;
      }
    }
  }

  TBSCC_LOGGER().debug("{} equivalence classes over {} spin channels",
                       blocks.maxCoeff(), num_spin);
  return data::EquivalenceMap(std::move(ids));
}

}  // namespace tbscc::algorithms
