// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <tbscc/data/spin_array.hpp>

namespace tbscc::data {

/**
 * @class EquivalenceMap
 * @brief Partition of (orbital, atom, spin) slots into equivalence classes
 *
 * Each slot holds a class id. Ids are positive and contiguous from 1 to
 * num_classes(); id 0 marks padding slots that belong to no class. The map
 * is used to compress charge vectors to one value per class before mixing
 * and convergence testing, and to expand mixed values back.
 */
class EquivalenceMap {
 public:
  EquivalenceMap() = default;

  /**
   * @brief Wrap an id array
   * @param ids Class ids shaped (orbital, atom, spin)
   * @throws ConfigurationError for negative ids, ids that are not contiguous
   * from 1, or an array that is not rank 3
   */
  explicit EquivalenceMap(SpinIndexArray ids);

  const SpinIndexArray& ids() const { return _ids; }

  /// Number of classes (the largest id)
  size_t num_classes() const { return _num_classes; }

  /// Number of spin channels covered by the map
  size_t num_spin() const { return _ids.num_spin(); }

  /**
   * @brief One value per class, the average of the slots in that class
   * @param per_orbital Array of the same shape as ids()
   * @return Vector of length num_classes(), entry k for class id k+1
   * @throws ConfigurationError on a shape mismatch
   */
  Eigen::VectorXd reduce(const SpinResolvedArray& per_orbital) const;

  /**
   * @brief Broadcast class values onto the slots of each class
   *
   * Padding slots are set to zero, so expand(reduce(x)) is idempotent.
   *
   * @param reduced Vector of length num_classes()
   * @throws ConfigurationError on a length mismatch
   */
  SpinResolvedArray expand(const Eigen::VectorXd& reduced) const;

 private:
  SpinIndexArray _ids;
  size_t _num_classes = 0;
  Eigen::VectorXd _class_sizes;
};

}  // namespace tbscc::data
