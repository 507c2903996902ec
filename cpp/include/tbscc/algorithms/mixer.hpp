// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <memory>
#include <string>
#include <tbscc/algorithms/factory.hpp>
#include <tbscc/data/settings.hpp>

namespace tbscc::algorithms {

/**
 * @brief Parameters shared by all charge mixers
 *
 * | key | default | meaning |
 * |---|---|---|
 * | mixing_parameter | 0.2 | weight of the residual in a linear step |
 * | history_size | 8 | number of previous iterations kept |
 * | broyden_weight_factor | 1e-2 | Broyden weight = factor / norm(residual) |
 * | broyden_min_weight | 1.0 | lower clamp of the Broyden weight |
 * | broyden_max_weight | 1e5 | upper clamp of the Broyden weight |
 * | broyden_omega0 | 1e-2 | weight of the initial Jacobian guess |
 */
class MixerSettings : public data::Settings {
 public:
  MixerSettings() {
    set_default("mixing_parameter", 0.2, "Linear mixing parameter",
                data::BoundConstraint<double>{0.0, 1.0});
    set_default("history_size", 8, "Number of stored previous iterations",
                data::BoundConstraint<int64_t>{1, 1000});
    set_default("broyden_weight_factor", 1e-2,
                "Broyden weight prefactor for the residual norm",
                data::BoundConstraint<double>{0.0});
    set_default("broyden_min_weight", 1.0, "Minimal Broyden weight",
                data::BoundConstraint<double>{0.0});
    set_default("broyden_max_weight", 1e5, "Maximal Broyden weight",
                data::BoundConstraint<double>{0.0});
    set_default("broyden_omega0", 1e-2,
                "Weight of the initial inverse Jacobian guess",
                data::BoundConstraint<double>{0.0});
  }
};

/**
 * @class Mixer
 * @brief Stateful update rule for the SCC fixed-point iteration
 *
 * Given the input vector x_n of iteration n and the residual
 * r_n = F(x_n) - x_n, mix() returns the next input x_{n+1}. Implementations
 * keep a history of previous pairs; reset() starts a new sequence and fixes
 * the vector length. The first step after reset() is always the linear step
 * x + alpha r.
 */
class Mixer {
 public:
  Mixer() : _settings(std::make_shared<MixerSettings>()) {}
  virtual ~Mixer() = default;

  virtual std::string name() const = 0;

  /**
   * @brief Drop the history and set the vector length
   */
  void reset(size_t dimension);

  /**
   * @brief Next input from the current input and residual
   * @throws InvariantViolation if the vector lengths differ from the length
   * passed to reset()
   */
  Eigen::VectorXd mix(const Eigen::VectorXd& input,
                      const Eigen::VectorXd& residual);

  size_t dimension() const { return _dimension; }

  /// Number of mix() calls since the last reset()
  size_t num_steps() const { return _num_steps; }

  data::Settings& settings() { return *_settings; }
  const data::Settings& settings() const { return *_settings; }

 protected:
  virtual void _reset_impl() = 0;
  virtual Eigen::VectorXd _mix_impl(const Eigen::VectorXd& input,
                                    const Eigen::VectorXd& residual) = 0;

  double _mixing_parameter() const {
    return _settings->get<double>("mixing_parameter");
  }
  size_t _history_size() const {
    return _settings->get<size_t>("history_size");
  }

  std::shared_ptr<MixerSettings> _settings;

 private:
  size_t _dimension = 0;
  size_t _num_steps = 0;
};

/**
 * @brief Factory for charge mixers
 *
 * Registered by default: "simple", "anderson", "diis" and "broyden".
 */
struct MixerFactory : public Factory<Mixer, MixerFactory> {
  static std::string algorithm_type_name() { return "mixer"; }
  static std::string default_algorithm_name() { return "broyden"; }
  static void register_default_instances();
};

}  // namespace tbscc::algorithms
