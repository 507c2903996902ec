// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <string>
#include <tbscc/data/orbital_layout.hpp>
#include <tbscc/data/spin_array.hpp>

namespace tbscc::algorithms {

/**
 * @class ElectrostaticShiftBuilder
 * @brief Charge dependent (Coulomb type) part of the shell potential
 */
class ElectrostaticShiftBuilder {
 public:
  virtual ~ElectrostaticShiftBuilder() = default;

  virtual std::string name() const = 0;

  /**
   * @brief Shell potential for the given total shell charges
   * @param charge_per_shell Array shaped (shell, atom, 1)
   * @param layout Orbital layout of the system
   * @return Shift of the same shape
   */
  virtual data::SpinResolvedArray build(
      const data::SpinResolvedArray& charge_per_shell,
      const data::OrbitalLayout& layout) = 0;
};

}  // namespace tbscc::algorithms
