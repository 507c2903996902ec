// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <tbscc/algorithms/spin_transform.hpp>
#include <tbscc/utils/errors.hpp>
#include <tbscc/utils/logger.hpp>

namespace tbscc::algorithms {

namespace {

enum class Direction { to_up_down, to_charge_mag };

void transform(double* data, size_t spin_stride, size_t num_spin,
               Direction direction) {
  switch (num_spin) {
    case 1:
    case 4:
      return;
    case 2:
      break;
    default:
      TBSCC_LOGGER().error("Spin transform called with {} channels", num_spin);
      throw ConfigurationError("Spin transform supports 1, 2 or 4 channels, "
                               "got " +
                               std::to_string(num_spin));
  }

  double* first = data;
  double* second = data + spin_stride;
  if (direction == Direction::to_up_down) {
    for (size_t i = 0; i < spin_stride; ++i) {
      first[i] = 0.5 * (first[i] + second[i]);
      second[i] = first[i] - second[i];
    }
  } else {
    for (size_t i = 0; i < spin_stride; ++i) {
      first[i] = first[i] + second[i];
      second[i] = first[i] - 2.0 * second[i];
    }
  }
}

}  // namespace

void to_up_down(double* data, size_t spin_stride, size_t num_spin) {
  transform(data, spin_stride, num_spin, Direction::to_up_down);
}

void to_charge_mag(double* data, size_t spin_stride, size_t num_spin) {
  transform(data, spin_stride, num_spin, Direction::to_charge_mag);
}

void to_up_down(data::SpinResolvedArray& array) {
  to_up_down(array.data().data(), array.spin_stride(), array.num_spin());
}

void to_charge_mag(data::SpinResolvedArray& array) {
  to_charge_mag(array.data().data(), array.spin_stride(), array.num_spin());
}

data::SpinResolvedArray as_up_down(data::SpinResolvedArray array) {
  to_up_down(array);
  return array;
}

data::SpinResolvedArray as_charge_mag(data::SpinResolvedArray array) {
  to_charge_mag(array);
  return array;
}

}  // namespace tbscc::algorithms
