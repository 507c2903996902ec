// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <tbscc/data/equivalence_map.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::data {

EquivalenceMap::EquivalenceMap(SpinIndexArray ids) : _ids(std::move(ids)) {
  if (_ids.rank() != 3) {
    throw ConfigurationError("Equivalence ids must be shaped (orbital, atom, "
                             "spin), got " +
                             _ids.shape_string());
  }
  const auto& data = _ids.data();
  if (data.size() > 0 && data.minCoeff() < 0) {
    throw ConfigurationError("Equivalence ids must not be negative");
  }
  _num_classes = data.size() > 0 ? static_cast<size_t>(data.maxCoeff()) : 0;

  _class_sizes = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(_num_classes));
  for (Eigen::Index i = 0; i < data.size(); ++i) {
    if (data[i] > 0) _class_sizes[data[i] - 1] += 1.0;
  }
  for (Eigen::Index k = 0; k < _class_sizes.size(); ++k) {
    if (_class_sizes[k] == 0.0) {
      throw ConfigurationError("Equivalence id " + std::to_string(k + 1) +
                               " is unused; ids must be contiguous");
    }
  }
}

Eigen::VectorXd EquivalenceMap::reduce(
    const SpinResolvedArray& per_orbital) const {
  if (per_orbital.leading_shape() != _ids.leading_shape() ||
      per_orbital.num_spin() != _ids.num_spin()) {
    TBSCC_LOGGER().error("Cannot reduce {} through equivalence map {}",
                         per_orbital.shape_string(), _ids.shape_string());
    throw ConfigurationError("Cannot reduce array of shape " +
                             per_orbital.shape_string() +
                             " through equivalence map of shape " +
                             _ids.shape_string());
  }
  Eigen::VectorXd reduced =
      Eigen::VectorXd::Zero(static_cast<Eigen::Index>(_num_classes));
  const auto& ids = _ids.data();
  const auto& values = per_orbital.data();
  for (Eigen::Index i = 0; i < ids.size(); ++i) {
    if (ids[i] > 0) reduced[ids[i] - 1] += values[i];
  }
  return reduced.cwiseQuotient(_class_sizes);
}

SpinResolvedArray EquivalenceMap::expand(const Eigen::VectorXd& reduced) const {
  if (static_cast<size_t>(reduced.size()) != _num_classes) {
    TBSCC_LOGGER().error("Cannot expand {} values through {} classes",
                         reduced.size(), _num_classes);
    throw ConfigurationError("Cannot expand " + std::to_string(reduced.size()) +
                             " values through an equivalence map with " +
                             std::to_string(_num_classes) + " classes");
  }
  SpinResolvedArray result(_ids.leading_shape(), _ids.num_spin());
  const auto& ids = _ids.data();
  auto& values = result.data();
  for (Eigen::Index i = 0; i < ids.size(); ++i) {
    if (ids[i] > 0) values[i] = reduced[ids[i] - 1];
  }
  return result;
}

}  // namespace tbscc::data
