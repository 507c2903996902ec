// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <complex>
#include <memory>
#include <string>
#include <tbscc/algorithms/eigensolver.hpp>
#include <tbscc/algorithms/electrostatic_shift.hpp>
#include <tbscc/algorithms/mixer.hpp>
#include <tbscc/algorithms/population_analysis.hpp>
#include <tbscc/data/orbital_layout.hpp>
#include <tbscc/utils/logger.hpp>
#include <vector>

namespace testing {

/**
 * @brief Mulliken charges of the occupied levels
 *
 * Real case: q_mu = (P S)_mu,mu with P = C f C^T.
 *
 * Spinor case: eigenvectors are 2N x 2N with the up components in the first
 * N rows. With P_ab = C_a f C_b^H the columns are
 * q = Re[(P_uu + P_dd) S], mx = Re[(P_ud + P_du) S],
 * my = Re[i (P_ud - P_du) S] and mz = Re[(P_uu - P_dd) S], each taken on the
 * diagonal.
 */
class MullikenPopulation : public tbscc::algorithms::PopulationAnalysis {
 public:
  std::string name() const override { return "mulliken"; }

  Eigen::VectorXd populate(const Eigen::MatrixXd& eigenvectors,
                           const Eigen::VectorXd& occupations,
                           const Eigen::MatrixXd& overlap) override {
    const Eigen::MatrixXd density =
        eigenvectors * occupations.asDiagonal() * eigenvectors.transpose();
    return (density * overlap).diagonal();
  }

  Eigen::MatrixXd populate(const Eigen::MatrixXcd& eigenvectors,
                           const Eigen::VectorXd& occupations,
                           const Eigen::MatrixXd& overlap) override {
    using Complex = std::complex<double>;
    const Eigen::Index n = overlap.rows();
    const Eigen::MatrixXcd c_up = eigenvectors.topRows(n);
    const Eigen::MatrixXcd c_dn = eigenvectors.bottomRows(n);
    const Eigen::MatrixXcd f = occupations.cast<Complex>().asDiagonal();
    const Eigen::MatrixXcd s = overlap.cast<Complex>();
    const Eigen::MatrixXcd p_uu = c_up * f * c_up.adjoint();
    const Eigen::MatrixXcd p_dd = c_dn * f * c_dn.adjoint();
    const Eigen::MatrixXcd p_ud = c_up * f * c_dn.adjoint();
    const Eigen::MatrixXcd p_du = c_dn * f * c_up.adjoint();
    const Complex i_unit(0.0, 1.0);

    Eigen::MatrixXd pop(n, 4);
    pop.col(0) = ((p_uu + p_dd) * s).diagonal().real();
    pop.col(1) = ((p_ud + p_du) * s).diagonal().real();
    pop.col(2) = (i_unit * (p_ud - p_du) * s).diagonal().real();
    pop.col(3) = ((p_uu - p_dd) * s).diagonal().real();
    return pop;
  }
};

/**
 * @brief Returns one electron per orbital whatever the eigenvectors are
 */
class ConstantPopulation : public tbscc::algorithms::PopulationAnalysis {
 public:
  explicit ConstantPopulation(double value = 1.0) : value_(value) {}

  std::string name() const override { return "constant"; }

  Eigen::VectorXd populate(const Eigen::MatrixXd& eigenvectors,
                           const Eigen::VectorXd&,
                           const Eigen::MatrixXd&) override {
    return Eigen::VectorXd::Constant(eigenvectors.rows(), value_);
  }

  Eigen::MatrixXd populate(const Eigen::MatrixXcd& eigenvectors,
                           const Eigen::VectorXd&,
                           const Eigen::MatrixXd&) override {
    Eigen::MatrixXd pop = Eigen::MatrixXd::Zero(eigenvectors.rows() / 2, 4);
    pop.col(0).setConstant(value_);
    return pop;
  }

 private:
  double value_;
};

/**
 * @brief On-site shell shift U (q - q_ref)
 */
class HubbardShift : public tbscc::algorithms::ElectrostaticShiftBuilder {
 public:
  HubbardShift(double hubbard_u, double reference_charge)
      : hubbard_u_(hubbard_u), reference_charge_(reference_charge) {}

  std::string name() const override { return "hubbard"; }

  tbscc::data::SpinResolvedArray build(
      const tbscc::data::SpinResolvedArray& charge_per_shell,
      const tbscc::data::OrbitalLayout& layout) override {
    ++calls;
    auto shift = layout.make_shell_array(1);
    for (size_t atom = 0; atom < layout.num_atoms(); ++atom) {
      for (size_t l = 0; l < layout.num_shells_on_atom(atom); ++l) {
        shift(l, atom, 0) =
            hubbard_u_ * (charge_per_shell(l, atom, 0) - reference_charge_);
      }
    }
    return shift;
  }

  size_t calls = 0;

 private:
  double hubbard_u_;
  double reference_charge_;
};

/**
 * @brief DenseEigensolver that counts its calls
 */
class CountingEigensolver : public tbscc::algorithms::DenseEigensolver {
 public:
  std::string name() const override { return "counting"; }

  tbscc::algorithms::RealEigenSolution solve(
      const Eigen::MatrixXd& hamiltonian,
      const Eigen::MatrixXd& overlap) override {
    ++calls;
    return DenseEigensolver::solve(hamiltonian, overlap);
  }

  tbscc::algorithms::ComplexEigenSolution solve(
      const Eigen::MatrixXcd& hamiltonian,
      const Eigen::MatrixXcd& overlap) override {
    ++calls;
    return DenseEigensolver::solve(hamiltonian, overlap);
  }

  size_t calls = 0;
};

/**
 * @brief Eigensolver that always reports the given status
 */
class FailingEigensolver : public tbscc::algorithms::Eigensolver {
 public:
  explicit FailingEigensolver(int status) : status_(status) {}

  std::string name() const override { return "failing"; }

  tbscc::algorithms::RealEigenSolution solve(const Eigen::MatrixXd&,
                                             const Eigen::MatrixXd&) override {
    tbscc::algorithms::RealEigenSolution solution;
    solution.status = status_;
    solution.message = "forced failure";
    return solution;
  }

  tbscc::algorithms::ComplexEigenSolution solve(
      const Eigen::MatrixXcd&, const Eigen::MatrixXcd&) override {
    tbscc::algorithms::ComplexEigenSolution solution;
    solution.status = status_;
    solution.message = "forced failure";
    return solution;
  }

 private:
  int status_;
};

/**
 * @brief Linear mixer that counts its steps
 */
class CountingMixer : public tbscc::algorithms::Mixer {
 public:
  std::string name() const override { return "counting"; }

  size_t resets = 0;

 protected:
  void _reset_impl() override { ++resets; }
  Eigen::VectorXd _mix_impl(const Eigen::VectorXd& input,
                            const Eigen::VectorXd& residual) override {
    return input + _mixing_parameter() * residual;
  }
};

/// Hydrogen like species, a single s shell
inline tbscc::data::Species s_species(double spin_coupling = -0.07) {
  return {"H", {0}, Eigen::MatrixXd::Constant(1, 1, spin_coupling)};
}

/// Carbon like species with an s and a p shell
inline tbscc::data::Species sp_species() {
  Eigen::MatrixXd w(2, 2);
  w << -0.03, -0.025, -0.025, -0.023;
  return {"C", {0, 1}, w};
}

/**
 * @brief Open chain of identical s-shell atoms
 *
 * On-site energy -0.5, nearest neighbour hopping and overlap as given.
 */
inline std::shared_ptr<tbscc::data::TightBindingModel> s_chain_model(
    size_t num_atoms, double hopping = -0.3, double overlap = 0.1,
    double spin_coupling = -0.07) {
  tbscc::data::OrbitalLayout layout({s_species(spin_coupling)},
                                    std::vector<size_t>(num_atoms, 0));
  const auto n = static_cast<Eigen::Index>(num_atoms);
  Eigen::MatrixXd h0 = -0.5 * Eigen::MatrixXd::Identity(n, n);
  Eigen::MatrixXd s = Eigen::MatrixXd::Identity(n, n);
  for (Eigen::Index i = 0; i + 1 < n; ++i) {
    h0(i, i + 1) = h0(i + 1, i) = hopping;
    s(i, i + 1) = s(i + 1, i) = overlap;
  }
  return std::make_shared<tbscc::data::TightBindingModel>(
      tbscc::data::TightBindingModel{std::move(layout), h0, s});
}

/**
 * @brief Two atoms of different species: an sp atom followed by an s atom
 */
inline std::shared_ptr<tbscc::data::TightBindingModel> sp_s_model() {
  tbscc::data::OrbitalLayout layout({sp_species(), s_species()}, {0, 1});
  Eigen::MatrixXd h0 = Eigen::MatrixXd::Zero(5, 5);
  h0.diagonal() << -0.50, -0.19, -0.19, -0.19, -0.24;
  Eigen::MatrixXd s = Eigen::MatrixXd::Identity(5, 5);
  // s and p_z of the first atom couple to the s orbital of the second
  h0(0, 4) = h0(4, 0) = -0.35;
  h0(3, 4) = h0(4, 3) = -0.25;
  s(0, 4) = s(4, 0) = 0.12;
  s(3, 4) = s(4, 3) = 0.08;
  return std::make_shared<tbscc::data::TightBindingModel>(
      tbscc::data::TightBindingModel{std::move(layout), h0, s});
}

/// Orbital array holding the same charge on every real orbital slot
inline tbscc::data::SpinResolvedArray uniform_charges(
    const tbscc::data::OrbitalLayout& layout, size_t num_spin,
    double charge_per_orbital) {
  auto charges = layout.make_orbital_array(num_spin);
  for (size_t atom = 0; atom < layout.num_atoms(); ++atom) {
    for (size_t mu = 0; mu < layout.num_orbitals_on_atom(atom); ++mu) {
      charges(mu, atom, 0) = charge_per_orbital;
    }
  }
  return charges;
}

}  // namespace testing
