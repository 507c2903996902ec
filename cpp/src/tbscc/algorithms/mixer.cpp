// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <tbscc/algorithms/mixer.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

#include "mixers/anderson.hpp"
#include "mixers/broyden.hpp"
#include "mixers/diis.hpp"
#include "mixers/simple.hpp"

namespace tbscc::algorithms {

void Mixer::reset(size_t dimension) {
  TBSCC_LOG_TRACE_ENTERING();
  _dimension = dimension;
  _num_steps = 0;
  _reset_impl();
}

Eigen::VectorXd Mixer::mix(const Eigen::VectorXd& input,
                           const Eigen::VectorXd& residual) {
  if (static_cast<size_t>(input.size()) != _dimension ||
      static_cast<size_t>(residual.size()) != _dimension) {
    TBSCC_LOGGER().error("Mixer '{}' set up for {} entries got {} and {}",
                         name(), _dimension, input.size(), residual.size());
    throw InvariantViolation("Mixer '" + name() + "' expects vectors of " +
                             std::to_string(_dimension) + " entries, got " +
                             std::to_string(input.size()) + " and " +
                             std::to_string(residual.size()));
  }
  auto next = _mix_impl(input, residual);
  ++_num_steps;
  return next;
}

std::unique_ptr<Mixer> make_simple_mixer() {
  return std::make_unique<mixers::SimpleMixer>();
}

std::unique_ptr<Mixer> make_anderson_mixer() {
  return std::make_unique<mixers::AndersonMixer>();
}

std::unique_ptr<Mixer> make_diis_mixer() {
  return std::make_unique<mixers::DiisMixer>();
}

std::unique_ptr<Mixer> make_broyden_mixer() {
  return std::make_unique<mixers::BroydenMixer>();
}

void MixerFactory::register_default_instances() {
  MixerFactory::register_instance(&make_simple_mixer);
  MixerFactory::register_instance(&make_anderson_mixer);
  MixerFactory::register_instance(&make_diis_mixer);
  MixerFactory::register_instance(&make_broyden_mixer);
}

}  // namespace tbscc::algorithms
