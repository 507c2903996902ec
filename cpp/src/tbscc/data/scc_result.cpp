// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <tbscc/data/scc_result.hpp>
#include <tbscc/utils/logger.hpp>

#include "hdf5_serialization.hpp"

namespace tbscc::data {

namespace {

constexpr const char* kGroupName = "scc_result";

const std::vector<std::pair<SccState, std::string>>& state_names() {
  static const std::vector<std::pair<SccState, std::string>> names = {
      {SccState::init, "init"},
      {SccState::iterating, "iterating"},
      {SccState::converged, "converged"},
      {SccState::max_iter_reached, "max_iter_reached"},
      {SccState::diag_failed, "diag_failed"},
      {SccState::aborted, "aborted"}};
  return names;
}

void write_if_set(H5::Group& group, const std::string& name,
                  const SpinResolvedArray& array) {
  if (array.num_spin() > 0) write_spin_array(group, name, array);
}

SpinResolvedArray read_if_present(H5::Group& group, const std::string& name) {
  if (!dataset_exists_in_group(group, name)) return {};
  return read_spin_array<double>(group, name);
}

}  // namespace

std::string to_string(SccState state) {
  for (const auto& [value, name] : state_names()) {
    if (value == state) return name;
  }
  return "unknown";
}

SccState scc_state_from_string(const std::string& name) {
  for (const auto& [value, known] : state_names()) {
    if (known == name) return value;
  }
  throw std::invalid_argument("Unknown SCC state '" + name + "'");
}

double SccResult::total_charge() const {
  if (charges.num_spin() == 0) return 0.0;
  return charges.spin_blocks().col(0).sum();
}

double SccResult::total_magnetization() const {
  if (charges.num_spin() < 2) return 0.0;
  return charges.spin_blocks()
      .col(static_cast<Eigen::Index>(charges.num_spin() - 1))
      .sum();
}

nlohmann::json SccResult::to_json() const {
  nlohmann::json j;
  j["state"] = to_string(state);
  j["iterations"] = iterations;
  j["residual"] = residual;
  j["residual_history"] = residual_history;
  j["num_spin"] = num_spin();
  j["total_charge"] = total_charge();
  j["total_magnetization"] = total_magnetization();
  j["spin_energy"] = spin_energy;
  j["fermi_level"] = fermi_level;
  j["num_equivalence_classes"] = equivalence.num_classes();
  return j;
}

void SccResult::to_json_file(const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + filename);
  }
  file << std::setw(2) << to_json() << std::endl;
  if (file.fail()) {
    throw std::runtime_error("Error writing SCC result to file: " + filename);
  }
}

void SccResult::to_hdf5_file(const std::string& filename) const {
  TBSCC_LOG_TRACE_ENTERING();
  try {
    H5::H5File file(filename, H5F_ACC_TRUNC);
    H5::Group group = file.createGroup(kGroupName);

    write_attribute(group, "state", to_string(state));
    write_attribute(group, "iterations", static_cast<int>(iterations));
    write_attribute(group, "residual", residual);
    write_attribute(group, "spin_energy", spin_energy);
    write_attribute(group, "fermi_level", fermi_level);
    write_attribute(group, "num_eigenproblems",
                    static_cast<int>(eigenvalues.size()));

    write_std_vector(group, "residual_history", residual_history);
    write_if_set(group, "charges", charges);
    write_if_set(group, "input_charges", input_charges);
    write_if_set(group, "shell_charges", shell_charges);
    write_if_set(group, "shift", shift);
    write_if_set(group, "spin_shift", spin_shift);
    write_if_set(group, "up_down_charges", up_down_charges);
    write_vector(group, "spin_energy_per_atom", spin_energy_per_atom);
    for (size_t k = 0; k < eigenvalues.size(); ++k) {
      write_vector(group, "eigenvalues_" + std::to_string(k), eigenvalues[k]);
    }
    if (equivalence.num_spin() > 0) {
      write_spin_array(group, "equivalence", equivalence.ids());
    }
  } catch (const H5::Exception& e) {
    TBSCC_LOGGER().error("Writing {} failed: {}", filename, e.getDetailMsg());
    throw std::runtime_error("Cannot write SCC result to " + filename + ": " +
                             e.getDetailMsg());
  }
}

SccResult SccResult::from_hdf5_file(const std::string& filename) {
  TBSCC_LOG_TRACE_ENTERING();
  SccResult result;
  try {
    H5::H5File file(filename, H5F_ACC_RDONLY);
    H5::Group group = file.openGroup(kGroupName);

    result.state = scc_state_from_string(read_string_attribute(group, "state"));
    result.iterations =
        static_cast<size_t>(read_int_attribute(group, "iterations"));
    result.residual = read_double_attribute(group, "residual");
    result.spin_energy = read_double_attribute(group, "spin_energy");
    result.fermi_level = read_double_attribute(group, "fermi_level");

    result.residual_history =
        read_std_vector<double>(group, "residual_history");
    result.charges = read_if_present(group, "charges");
    result.input_charges = read_if_present(group, "input_charges");
    result.shell_charges = read_if_present(group, "shell_charges");
    result.shift = read_if_present(group, "shift");
    result.spin_shift = read_if_present(group, "spin_shift");
    result.up_down_charges = read_if_present(group, "up_down_charges");
    result.spin_energy_per_atom = read_vector(group, "spin_energy_per_atom");
    const int n_eigen = read_int_attribute(group, "num_eigenproblems");
    for (int k = 0; k < n_eigen; ++k) {
      result.eigenvalues.push_back(
          read_vector(group, "eigenvalues_" + std::to_string(k)));
    }
    if (dataset_exists_in_group(group, "equivalence")) {
      result.equivalence =
          EquivalenceMap(read_spin_array<int>(group, "equivalence"));
    }
  } catch (const H5::Exception& e) {
    TBSCC_LOGGER().error("Reading {} failed: {}", filename, e.getDetailMsg());
    throw std::runtime_error("Cannot read SCC result from " + filename + ": " +
                             e.getDetailMsg());
  }
  return result;
}

}  // namespace tbscc::data
