// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <complex>
#include <limits>
#include <tbscc/algorithms/occupation.hpp>
#include <tbscc/algorithms/orbital_equivalence.hpp>
#include <tbscc/algorithms/scc.hpp>
#include <tbscc/algorithms/spin_energy.hpp>
#include <tbscc/algorithms/spin_shift.hpp>
#include <tbscc/algorithms/spin_transform.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms {

struct SccDriver::IterationOutput {
  data::SpinResolvedArray shift;
  data::SpinResolvedArray output_charges;
  std::vector<Eigen::VectorXd> eigenvalues;
  double fermi_level = 0.0;
};

namespace {

[[noreturn]] void configuration_error(const std::string& message) {
  TBSCC_LOGGER().error(message);
  throw ConfigurationError(message);
}

template <typename Solution>
void check_solution(const Solution& solution, Eigen::Index dimension,
                    size_t iteration) {
  if (solution.status != 0) {
    TBSCC_LOGGER().error("Eigensolver status {} in SCC iteration {}: {}",
                         solution.status, iteration, solution.message);
    throw NumericalFailure(solution.status, iteration, solution.message);
  }
  if (solution.eigenvalues.size() != dimension ||
      solution.eigenvectors.rows() != dimension ||
      solution.eigenvectors.cols() != dimension) {
    TBSCC_LOGGER().error("Eigensolver returned {} eigenpairs for {}",
                         solution.eigenvalues.size(), dimension);
    throw InvariantViolation("Eigensolver returned " +
                             std::to_string(solution.eigenvalues.size()) +
                             " eigenpairs for dimension " +
                             std::to_string(dimension));
  }
}

void check_populations(Eigen::Index rows, Eigen::Index cols,
                       Eigen::Index expected_rows, Eigen::Index expected_cols) {
  if (rows != expected_rows || cols != expected_cols) {
    TBSCC_LOGGER().error("Population analysis returned {}x{} values", rows,
                         cols);
    throw InvariantViolation("Population analysis returned " +
                             std::to_string(rows) + "x" +
                             std::to_string(cols) + " values, expected " +
                             std::to_string(expected_rows) + "x" +
                             std::to_string(expected_cols));
  }
}

}  // namespace

SccDriver::SccDriver(std::shared_ptr<const data::TightBindingModel> model,
                     std::shared_ptr<Eigensolver> eigensolver,
                     std::shared_ptr<PopulationAnalysis> population,
                     std::shared_ptr<ElectrostaticShiftBuilder> electrostatics,
                     std::shared_ptr<Mixer> mixer)
    : model_(std::move(model)),
      eigensolver_(std::move(eigensolver)),
      population_(std::move(population)),
      electrostatics_(std::move(electrostatics)),
      mixer_(std::move(mixer)),
      settings_(std::make_shared<SccSettings>()) {
  TBSCC_LOG_TRACE_ENTERING();
  if (!model_) configuration_error("SCC driver needs a model");
  if (!eigensolver_) configuration_error("SCC driver needs an eigensolver");
  if (!population_) {
    configuration_error("SCC driver needs a population analysis");
  }
  if (!electrostatics_) {
    configuration_error("SCC driver needs an electrostatic shift builder");
  }
  model_->validate();
}

data::SccResult SccDriver::run(const data::SpinResolvedArray& initial_charges) {
  TBSCC_LOG_TRACE_ENTERING();
  settings_->lock();
  // Requests left over from a finished run do not carry into this one
  abort_requested_.store(false);
  const auto& layout = model_->layout;
  const auto n_spin = settings_->get<size_t>("spin_channels");
  const auto max_iterations = settings_->get<size_t>("max_scc_iterations");
  const double tolerance = settings_->get<double>("scc_tolerance");
  const bool fatal = settings_->get<bool>("convergence_failure_is_fatal");
  const double num_electrons = settings_->get<double>("num_electrons");

  if (!layout.is_orbital_array(initial_charges) ||
      initial_charges.num_spin() != n_spin) {
    configuration_error(
        "Initial charges must be shaped (" +
        std::to_string(layout.max_orbitals()) + ", " +
        std::to_string(layout.num_atoms()) + ", " + std::to_string(n_spin) +
        "), got " + initial_charges.shape_string());
  }
  const double capacity = 2.0 * static_cast<double>(layout.num_orbitals());
  if (num_electrons > capacity) {
    configuration_error("Cannot place " + std::to_string(num_electrons) +
                        " electrons into " +
                        std::to_string(layout.num_orbitals()) + " orbitals");
  }

  if (!mixer_) {
    mixer_ = MixerFactory::create(settings_->get<std::string>("mixer"));
  }
  equivalence_ = build_orbital_equivalence(layout, n_spin);
  mixer_->reset(equivalence_.num_classes());

  TBSCC_LOGGER().info(
      "SCC start: {} atoms, {} orbitals, {} spin channels, {} classes, "
      "mixer '{}'",
      layout.num_atoms(), layout.num_orbitals(), n_spin,
      equivalence_.num_classes(), mixer_->name());

  data::SccResult result;
  result.charges = initial_charges;
  result.input_charges = initial_charges;
  result.shift = layout.make_shell_array(n_spin);
  state_ = SccState::iterating;

  if (max_iterations == 0) {
    state_ = SccState::max_iter_reached;
  }

  data::SpinResolvedArray input = initial_charges;
  for (size_t iteration = 1; state_ == SccState::iterating; ++iteration) {
    if (abort_requested_.exchange(false)) {
      TBSCC_LOGGER().warn("SCC aborted before iteration {}", iteration);
      state_ = SccState::aborted;
      break;
    }

    auto output = iterate_(input, iteration);

    const Eigen::VectorXd reduced_input = equivalence_.reduce(input);
    const Eigen::VectorXd reduced_residual =
        equivalence_.reduce(output.output_charges) - reduced_input;
    const double residual = residual_norm_(reduced_residual);

    result.iterations = iteration;
    result.residual = residual;
    result.residual_history.push_back(residual);
    result.input_charges = input;
    result.charges = std::move(output.output_charges);
    result.shift = std::move(output.shift);
    result.eigenvalues = std::move(output.eigenvalues);
    result.fermi_level = output.fermi_level;

    TBSCC_LOGGER().debug("SCC iteration {:4d}  residual {:.6e}  Ef {:.8f}",
                         iteration, residual, result.fermi_level);

    if (residual < tolerance) {
      state_ = SccState::converged;
    } else if (iteration >= max_iterations) {
      state_ = SccState::max_iter_reached;
    } else {
      input = equivalence_.expand(mixer_->mix(reduced_input, reduced_residual));
    }
    notify_(iteration, residual);
  }

  finalize_(result);

  switch (state_) {
    case SccState::converged:
      TBSCC_LOGGER().info("SCC converged in {} iterations, residual {:.3e}",
                          result.iterations, result.residual);
      break;
    case SccState::max_iter_reached:
      TBSCC_LOGGER().warn(
          "SCC not converged after {} iterations, residual {:.3e}",
          result.iterations, result.residual);
      if (fatal) {
        TBSCC_LOGGER().error("Non-converged SCC treated as fatal");
        throw ConvergenceFailure(result.residual, result.iterations);
      }
      break;
    default:
      break;
  }
  return result;
}

SccDriver::IterationOutput SccDriver::iterate_(
    const data::SpinResolvedArray& input_charges, size_t iteration) {
  const auto& layout = model_->layout;
  const auto& overlap = model_->overlap;
  const size_t n_spin = input_charges.num_spin();
  const Eigen::Index n = overlap.rows();
  const double num_electrons = settings_->get<double>("num_electrons");
  const double degeneracy = settings_->get<double>("degeneracy_tolerance");

  IterationOutput out;
  out.shift = build_shift_(layout.shell_sum(input_charges));
  auto hamiltonians = build_hamiltonians_(out.shift);
  out.output_charges = layout.make_orbital_array(n_spin);

  auto fail_on = [&](const auto& solution, Eigen::Index dimension) {
    try {
      check_solution(solution, dimension, iteration);
    } catch (const NumericalFailure&) {
      state_ = SccState::diag_failed;
      throw;
    }
  };

  if (n_spin == 1) {
    const auto solution = eigensolver_->solve(hamiltonians[0], overlap);
    fail_on(solution, n);
    const auto occ =
        fill_aufbau({solution.eigenvalues}, num_electrons, 2.0, degeneracy);
    const Eigen::VectorXd pop = population_->populate(
        solution.eigenvectors, occ.occupations[0], overlap);
    check_populations(pop.rows(), 1, n, 1);
    layout.unflatten(pop, 0, out.output_charges);
    out.eigenvalues = {solution.eigenvalues};
    out.fermi_level = occ.fermi_level;
  } else if (n_spin == 2) {
    // (2 H_q, 2 H_m) -> (H_q + H_m, H_q - H_m)
    data::SpinResolvedArray stack(
        {static_cast<size_t>(n), static_cast<size_t>(n)}, 2);
    auto blocks = stack.spin_blocks();
    for (Eigen::Index c = 0; c < 2; ++c) {
      blocks.col(c) = 2.0 * hamiltonians[static_cast<size_t>(c)].reshaped();
    }
    to_up_down(stack);

    std::vector<RealEigenSolution> solutions;
    for (Eigen::Index s = 0; s < 2; ++s) {
      const Eigen::MatrixXd h = blocks.col(s).reshaped(n, n);
      solutions.push_back(eigensolver_->solve(h, overlap));
      fail_on(solutions.back(), n);
      out.eigenvalues.push_back(solutions.back().eigenvalues);
    }
    const auto occ =
        fill_aufbau(out.eigenvalues, num_electrons, 1.0, degeneracy);
    for (size_t s = 0; s < 2; ++s) {
      const Eigen::VectorXd pop = population_->populate(
          solutions[s].eigenvectors, occ.occupations[s], overlap);
      check_populations(pop.rows(), 1, n, 1);
      layout.unflatten(pop, s, out.output_charges);
    }
    to_charge_mag(out.output_charges);
    out.fermi_level = occ.fermi_level;
  } else {
    // Pauli form [[H_q + H_z, H_x - i H_y], [H_x + i H_y, H_q - H_z]]
    using Complex = std::complex<double>;
    const Complex i_unit(0.0, 1.0);
    const Eigen::MatrixXcd h_x = hamiltonians[1].cast<Complex>();
    const Eigen::MatrixXcd h_y = hamiltonians[2].cast<Complex>();
    Eigen::MatrixXcd h(2 * n, 2 * n);
    h.topLeftCorner(n, n) = (hamiltonians[0] + hamiltonians[3]).cast<Complex>();
    h.bottomRightCorner(n, n) =
        (hamiltonians[0] - hamiltonians[3]).cast<Complex>();
    h.topRightCorner(n, n) = h_x - i_unit * h_y;
    h.bottomLeftCorner(n, n) = h_x + i_unit * h_y;
    Eigen::MatrixXcd s = Eigen::MatrixXcd::Zero(2 * n, 2 * n);
    s.topLeftCorner(n, n) = overlap.cast<Complex>();
    s.bottomRightCorner(n, n) = overlap.cast<Complex>();

    const auto solution = eigensolver_->solve(h, s);
    fail_on(solution, 2 * n);
    const auto occ =
        fill_aufbau({solution.eigenvalues}, num_electrons, 1.0, degeneracy);
    const Eigen::MatrixXd pop = population_->populate(
        solution.eigenvectors, occ.occupations[0], overlap);
    check_populations(pop.rows(), pop.cols(), n, 4);
    for (size_t c = 0; c < 4; ++c) {
      layout.unflatten(pop.col(static_cast<Eigen::Index>(c)), c,
                       out.output_charges);
    }
    out.eigenvalues = {solution.eigenvalues};
    out.fermi_level = occ.fermi_level;
  }
  return out;
}

data::SpinResolvedArray SccDriver::build_shift_(
    const data::SpinResolvedArray& shell_charges) const {
  const auto& layout = model_->layout;
  const size_t n_spin = shell_charges.num_spin();
  auto shift = layout.make_shell_array(n_spin);

  const auto electrostatic =
      electrostatics_->build(shell_charges.spin_slice(0, 1), layout);
  if (!layout.is_shell_array(electrostatic) || electrostatic.num_spin() != 1) {
    throw InvariantViolation("Electrostatic shift has shape " +
                             electrostatic.shape_string());
  }
  shift.assign_spin_slice(0, electrostatic);

  if (n_spin > 1) {
    shift.assign_spin_slice(
        1, build_spin_shift(shell_charges.spin_slice(1, n_spin - 1), layout));
  }
  return shift;
}

std::vector<Eigen::MatrixXd> SccDriver::build_hamiltonians_(
    const data::SpinResolvedArray& shell_shift) const {
  const auto& layout = model_->layout;
  const auto& overlap = model_->overlap;
  const Eigen::Index n = overlap.rows();
  const auto orbital_shift = layout.shell_to_orbital(shell_shift);

  std::vector<Eigen::MatrixXd> hamiltonians;
  for (size_t c = 0; c < shell_shift.num_spin(); ++c) {
    const Eigen::VectorXd v = layout.flatten(orbital_shift, c);
    Eigen::MatrixXd h = Eigen::MatrixXd::Zero(n, n);
    if (c == 0) h = model_->hamiltonian0;
    // Columns are independent
#pragma omp parallel for schedule(static)
    for (Eigen::Index j = 0; j < n; ++j) {
      for (Eigen::Index i = 0; i < n; ++i) {
        h(i, j) += 0.5 * overlap(i, j) * (v[i] + v[j]);
      }
    }
    hamiltonians.push_back(std::move(h));
  }
  return hamiltonians;
}

double SccDriver::residual_norm_(const Eigen::VectorXd& residual) const {
  if (residual.size() == 0) return 0.0;
  if (settings_->get<std::string>("residual_norm") == "l2") {
    return residual.norm();
  }
  return residual.cwiseAbs().maxCoeff();
}

void SccDriver::finalize_(data::SccResult& result) const {
  const auto& layout = model_->layout;
  const size_t n_spin = result.charges.num_spin();
  result.state = state_;
  result.equivalence = equivalence_;
  result.shell_charges = layout.shell_sum(result.charges);
  result.spin_shift = layout.make_shell_array(n_spin);
  result.spin_energy_per_atom =
      Eigen::VectorXd::Zero(static_cast<Eigen::Index>(layout.num_atoms()));
  if (n_spin > 1) {
    result.spin_shift.assign_spin_slice(
        1, build_spin_shift(result.shell_charges.spin_slice(1, n_spin - 1),
                            layout));
    result.spin_energy = spin_energy(result.shell_charges, result.spin_shift);
    result.spin_energy_per_atom =
        spin_energy_per_atom(result.shell_charges, result.spin_shift);
  }
  result.up_down_charges = as_up_down(result.charges);
}

void SccDriver::notify_(size_t iteration, double residual) const {
  if (observer_) {
    observer_(SccIterationInfo{iteration, residual, state_});
  }
}

}  // namespace tbscc::algorithms
