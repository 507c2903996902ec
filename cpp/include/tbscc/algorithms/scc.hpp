// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <tbscc/algorithms/eigensolver.hpp>
#include <tbscc/algorithms/electrostatic_shift.hpp>
#include <tbscc/algorithms/mixer.hpp>
#include <tbscc/algorithms/population_analysis.hpp>
#include <tbscc/data/equivalence_map.hpp>
#include <tbscc/data/orbital_layout.hpp>
#include <tbscc/data/scc_result.hpp>
#include <tbscc/data/settings.hpp>

namespace tbscc::algorithms {

using data::SccState;

/**
 * @brief Configuration of the SCC loop
 *
 * | key | default | meaning |
 * |---|---|---|
 * | spin_channels | 1 | 1 (spin free), 2 (collinear) or 4 (non-collinear) |
 * | scc_tolerance | 1e-5 | convergence threshold of the residual |
 * | max_scc_iterations | 100 | iteration cap, 0 runs no iteration |
 * | num_electrons | 0.0 | electrons placed by aufbau filling |
 * | residual_norm | "max_abs" | "max_abs" or "l2" |
 * | convergence_failure_is_fatal | false | throw ConvergenceFailure at cap |
 * | mixer | "broyden" | mixer created when none is supplied |
 * | degeneracy_tolerance | 1e-8 | energy window of degenerate levels |
 */
class SccSettings : public data::Settings {
 public:
  SccSettings() {
    set_default("spin_channels", 1, "Number of spin channels",
                data::ListConstraint<int64_t>{{1, 2, 4}});
    set_default("scc_tolerance", 1e-5, "Residual convergence threshold",
                data::BoundConstraint<double>{0.0});
    set_default("max_scc_iterations", 100, "Maximum number of SCC iterations",
                data::BoundConstraint<int64_t>{0});
    set_default("num_electrons", 0.0, "Number of electrons",
                data::BoundConstraint<double>{0.0});
    set_default("residual_norm", "max_abs",
                "Norm of the reduced residual: max_abs or l2",
                data::ListConstraint<std::string>{{"max_abs", "l2"}});
    set_default("convergence_failure_is_fatal", false,
                "Throw ConvergenceFailure when the iteration cap is hit");
    set_default("mixer", "broyden", "Mixer used when none is supplied",
                data::ListConstraint<std::string>{MixerFactory::available()});
    set_default("degeneracy_tolerance", 1e-8,
                "Energy window for sharing electrons among degenerate levels",
                data::BoundConstraint<double>{0.0});
  }
};

/**
 * @brief Progress report passed to the observer after each iteration
 */
struct SccIterationInfo {
  size_t iteration;
  double residual;
  SccState state;
};

/**
 * @class SccDriver
 * @brief Self-consistent-charge fixed-point iteration with spin
 *
 * Each iteration takes per-orbital input charges in the charge/magnetization
 * basis and
 * 1. sums them into shells and builds the shell shift: the electrostatic
 *    part from the charge channel, the spin part (build_spin_shift) from the
 *    magnetization channels;
 * 2. assembles the Hamiltonian of every channel,
 *    H_c = delta_c0 H0 + 1/2 S o (V_c 1^T + 1 V_c^T), and hands the up/down
 *    (collinear) or 2x2 Pauli (non-collinear) form to the eigensolver;
 * 3. fills the levels by aufbau against a common Fermi level and obtains
 *    the output charges from the population analysis, converted back to the
 *    charge/magnetization basis;
 * 4. compresses input and output through the orbital EquivalenceMap and
 *    takes the norm of their difference as the residual;
 * 5. stops when the residual is below scc_tolerance or the iteration cap is
 *    reached, otherwise asks the mixer for the next compressed input and
 *    expands it back to orbitals.
 *
 * A non-zero eigensolver status ends the run in diag_failed with a
 * NumericalFailure; nothing is mixed in that iteration.
 *
 * Example:
 * ```cpp
 * SccDriver driver(model, std::make_shared<DenseEigensolver>(), mulliken,
 *                  gamma_shift);
 * driver.settings().set("spin_channels", 2);
 * driver.settings().set("num_electrons", 8.0);
 * auto result = driver.run(initial_charges);
 * ```
 */
class SccDriver {
 public:
  using Observer = std::function<void(const SccIterationInfo&)>;

  /**
   * @brief Set up a driver
   * @param model Layout, reference Hamiltonian and overlap
   * @param eigensolver Generalized eigensolver
   * @param population Population analysis
   * @param electrostatics Charge dependent shift builder
   * @param mixer Mixer; created from the "mixer" setting when null
   * @throws ConfigurationError for a null collaborator or an inconsistent
   * model
   */
  SccDriver(std::shared_ptr<const data::TightBindingModel> model,
            std::shared_ptr<Eigensolver> eigensolver,
            std::shared_ptr<PopulationAnalysis> population,
            std::shared_ptr<ElectrostaticShiftBuilder> electrostatics,
            std::shared_ptr<Mixer> mixer = nullptr);

  /**
   * @brief Iterate from the given per-orbital charges to a terminal state
   *
   * Settings are locked on entry and the mixer is reset.
   *
   * @param initial_charges Array shaped (max_orbitals, atom, spin_channels)
   * in the charge/magnetization basis
   * @return Snapshot of the last completed iteration
   * @throws ConfigurationError for an initial guess of the wrong shape or
   * more electrons than the basis holds
   * @throws NumericalFailure if the eigensolver reports a non-zero status
   * @throws ConvergenceFailure at the iteration cap when
   * convergence_failure_is_fatal is set
   */
  data::SccResult run(const data::SpinResolvedArray& initial_charges);

  /// Current lifecycle state
  SccState state() const { return state_; }

  /**
   * @brief Ask a running loop to stop before its next iteration
   *
   * Safe to call from another thread or from the observer. The run then
   * ends in state aborted with the last completed iteration as result. A
   * request that arrives after the last iteration is dropped when the next
   * run starts.
   */
  void request_abort() { abort_requested_.store(true); }

  void set_observer(Observer observer) { observer_ = std::move(observer); }

  data::Settings& settings() { return *settings_; }
  const data::Settings& settings() const { return *settings_; }

  /// Mixer in use; null until the first run when none was supplied
  std::shared_ptr<Mixer> mixer() const { return mixer_; }

  const data::TightBindingModel& model() const { return *model_; }

  /// Equivalence map of the last run
  const data::EquivalenceMap& equivalence() const { return equivalence_; }

 private:
  struct IterationOutput;

  data::SpinResolvedArray build_shift_(
      const data::SpinResolvedArray& shell_charges) const;
  std::vector<Eigen::MatrixXd> build_hamiltonians_(
      const data::SpinResolvedArray& shell_shift) const;
  IterationOutput iterate_(const data::SpinResolvedArray& input_charges,
                           size_t iteration);
  double residual_norm_(const Eigen::VectorXd& residual) const;
  void finalize_(data::SccResult& result) const;
  void notify_(size_t iteration, double residual) const;

  std::shared_ptr<const data::TightBindingModel> model_;
  std::shared_ptr<Eigensolver> eigensolver_;
  std::shared_ptr<PopulationAnalysis> population_;
  std::shared_ptr<ElectrostaticShiftBuilder> electrostatics_;
  std::shared_ptr<Mixer> mixer_;
  std::shared_ptr<SccSettings> settings_;
  Observer observer_;
  data::EquivalenceMap equivalence_;
  SccState state_ = SccState::init;
  std::atomic<bool> abort_requested_{false};
};

}  // namespace tbscc::algorithms
