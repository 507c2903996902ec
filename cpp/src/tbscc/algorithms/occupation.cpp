// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <tbscc/algorithms/occupation.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms {

namespace {

struct Level {
  double energy;
  size_t channel;
  Eigen::Index index;
};

}  // namespace

Occupations fill_aufbau(const std::vector<Eigen::VectorXd>& eigenvalues,
                        double num_electrons, double max_occupation,
                        double degeneracy_tolerance) {
  std::vector<Level> levels;
  Occupations result;
  for (size_t s = 0; s < eigenvalues.size(); ++s) {
    result.occupations.push_back(
        Eigen::VectorXd::Zero(eigenvalues[s].size()));
    for (Eigen::Index i = 0; i < eigenvalues[s].size(); ++i) {
      levels.push_back({eigenvalues[s][i], s, i});
    }
  }

  const double capacity = max_occupation * static_cast<double>(levels.size());
  if (num_electrons < 0.0 || num_electrons > capacity) {
    TBSCC_LOGGER().error("Cannot place {} electrons into {} levels of {}",
                         num_electrons, levels.size(), max_occupation);
    throw ConfigurationError("Cannot place " + std::to_string(num_electrons) +
                             " electrons into levels holding " +
                             std::to_string(capacity));
  }
  if (levels.empty()) return result;

  std::stable_sort(levels.begin(), levels.end(),
                   [](const Level& a, const Level& b) {
                     return a.energy < b.energy;
                   });

  result.fermi_level = levels.front().energy;
  double remaining = num_electrons;
  size_t first = 0;
  while (first < levels.size() && remaining > 0.0) {
    size_t last = first + 1;
    while (last < levels.size() &&
           levels[last].energy - levels[first].energy <= degeneracy_tolerance) {
      ++last;
    }
    const double group_capacity =
        max_occupation * static_cast<double>(last - first);
    const auto group_size = static_cast<double>(last - first);
    const double per_level = remaining >= group_capacity
                                 ? max_occupation
                                 : remaining / group_size;
    for (size_t k = first; k < last; ++k) {
      result.occupations[levels[k].channel][levels[k].index] = per_level;
    }
    remaining -= std::min(remaining, group_capacity);
    result.fermi_level = levels[last - 1].energy;
    first = last;
  }
  return result;
}

}  // namespace tbscc::algorithms
