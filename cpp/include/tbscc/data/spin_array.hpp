// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <numeric>
#include <string>
#include <tbscc/utils/errors.hpp>
#include <utility>
#include <vector>

namespace tbscc::data {

/**
 * @class SpinArray
 * @brief Column-major array of rank 1 to 4 whose last axis is the spin channel
 *
 * The array is described by its leading shape (0 to 3 extents) and the number
 * of spin channels. Storage is contiguous and column-major, so every spin
 * channel is one contiguous block of spin_stride() elements and the whole
 * array can be viewed as a (spin_stride x num_spin) matrix. Charge and shift
 * vectors are shaped (shell or orbital, atom, spin); Hamiltonian stacks are
 * shaped (orbital, orbital, spin).
 *
 * @tparam T Element type (double for charges and shifts, int for
 * equivalence ids)
 */
template <typename T>
class SpinArray {
 public:
  using Storage = Eigen::Matrix<T, Eigen::Dynamic, 1>;
  using SpinBlocks =
      Eigen::Map<Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>>;
  using ConstSpinBlocks =
      Eigen::Map<const Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>>;

  static constexpr size_t max_rank = 4;

  SpinArray() = default;

  /**
   * @brief Allocate an array filled with a constant
   * @param leading_shape Extents of the non-spin axes (at most 3)
   * @param num_spin Number of spin channels (at least 1)
   * @param value Initial value of every element
   * @throws ConfigurationError for an unsupported rank or zero spin channels
   */
  SpinArray(std::vector<size_t> leading_shape, size_t num_spin,
            T value = T(0))
      : _leading_shape(std::move(leading_shape)), _num_spin(num_spin) {
    _check_descriptor();
    _data = Storage::Constant(static_cast<Eigen::Index>(size()), value);
  }

  /**
   * @brief Wrap existing column-major data
   * @throws ConfigurationError if the data size does not match the shape
   */
  SpinArray(std::vector<size_t> leading_shape, size_t num_spin, Storage data)
      : _leading_shape(std::move(leading_shape)),
        _num_spin(num_spin),
        _data(std::move(data)) {
    _check_descriptor();
    if (static_cast<size_t>(_data.size()) != size()) {
      throw ConfigurationError("SpinArray data has " +
                               std::to_string(_data.size()) +
                               " elements, shape requires " +
                               std::to_string(size()));
    }
  }

  /// Extents of the non-spin axes
  const std::vector<size_t>& leading_shape() const { return _leading_shape; }

  /// Full shape, spin axis last
  std::vector<size_t> shape() const {
    std::vector<size_t> result = _leading_shape;
    result.push_back(_num_spin);
    return result;
  }

  size_t rank() const { return _leading_shape.size() + 1; }
  size_t num_spin() const { return _num_spin; }

  /// Number of elements in one spin channel
  size_t spin_stride() const {
    return std::accumulate(_leading_shape.begin(), _leading_shape.end(),
                           size_t{1}, std::multiplies<size_t>());
  }

  size_t size() const { return spin_stride() * _num_spin; }

  /// Extent of a leading axis
  size_t extent(size_t axis) const {
    if (axis >= _leading_shape.size()) {
      throw InvariantViolation("SpinArray axis " + std::to_string(axis) +
                               " out of range for rank " +
                               std::to_string(rank()));
    }
    return _leading_shape[axis];
  }

  Storage& data() { return _data; }
  const Storage& data() const { return _data; }

  /// (spin_stride x num_spin) view, one column per spin channel
  SpinBlocks spin_blocks() {
    return SpinBlocks(_data.data(), static_cast<Eigen::Index>(spin_stride()),
                      static_cast<Eigen::Index>(_num_spin));
  }
  ConstSpinBlocks spin_blocks() const {
    return ConstSpinBlocks(_data.data(),
                           static_cast<Eigen::Index>(spin_stride()),
                           static_cast<Eigen::Index>(_num_spin));
  }

  /**
   * @brief Element access; the last index is the spin channel
   * @throws InvariantViolation for a wrong index count or an index out of
   * range, naming the offending axis and index
   */
  template <typename... Idx>
  T& operator()(Idx... idx) {
    return _data[static_cast<Eigen::Index>(
        _offset({static_cast<size_t>(idx)...}))];
  }

  template <typename... Idx>
  const T& operator()(Idx... idx) const {
    return _data[static_cast<Eigen::Index>(
        _offset({static_cast<size_t>(idx)...}))];
  }

  /**
   * @brief Copy of spin channels [first, first + count)
   */
  SpinArray spin_slice(size_t first, size_t count) const {
    if (count == 0 || first + count > _num_spin) {
      throw InvariantViolation("Spin slice [" + std::to_string(first) + ", " +
                               std::to_string(first + count) +
                               ") out of range for " +
                               std::to_string(_num_spin) + " channels");
    }
    const auto stride = static_cast<Eigen::Index>(spin_stride());
    return SpinArray(_leading_shape, count,
                     Storage(_data.segment(static_cast<Eigen::Index>(first) *
                                               stride,
                                           static_cast<Eigen::Index>(count) *
                                               stride)));
  }

  /**
   * @brief Overwrite channels starting at first with the channels of source
   */
  void assign_spin_slice(size_t first, const SpinArray& source) {
    if (source._leading_shape != _leading_shape ||
        first + source._num_spin > _num_spin) {
      throw InvariantViolation("Spin slice assignment at channel " +
                               std::to_string(first) +
                               " does not fit the target array");
    }
    const auto stride = static_cast<Eigen::Index>(spin_stride());
    _data.segment(static_cast<Eigen::Index>(first) * stride,
                  source._data.size()) = source._data;
  }

  bool same_shape(const SpinArray& other) const {
    return _leading_shape == other._leading_shape &&
           _num_spin == other._num_spin;
  }

  /// Shape rendered as "(a, b, spin)" for diagnostics
  std::string shape_string() const {
    std::string result = "(";
    for (size_t extent : _leading_shape) {
      result += std::to_string(extent) + ", ";
    }
    return result + std::to_string(_num_spin) + ")";
  }

 private:
  void _check_descriptor() const {
    if (_leading_shape.size() + 1 > max_rank) {
      throw ConfigurationError("SpinArray rank " +
                               std::to_string(_leading_shape.size() + 1) +
                               " exceeds the supported maximum of 4");
    }
    if (_num_spin == 0) {
      throw ConfigurationError("SpinArray needs at least one spin channel");
    }
  }

  size_t _offset(std::initializer_list<size_t> idx) const {
    if (idx.size() != rank()) {
      throw InvariantViolation("SpinArray of rank " + std::to_string(rank()) +
                               " indexed with " + std::to_string(idx.size()) +
                               " indices");
    }
    size_t offset = 0;
    size_t stride = 1;
    size_t axis = 0;
    for (size_t i : idx) {
      const size_t extent =
          axis < _leading_shape.size() ? _leading_shape[axis] : _num_spin;
      if (i >= extent) {
        throw InvariantViolation("Index " + std::to_string(i) + " on axis " +
                                 std::to_string(axis) + " out of range for " +
                                 shape_string());
      }
      offset += i * stride;
      stride *= extent;
      ++axis;
    }
    return offset;
  }

  std::vector<size_t> _leading_shape;
  size_t _num_spin = 0;
  Storage _data;
};

/// Real-valued spin resolved array (charges, shifts, Hamiltonian stacks)
using SpinResolvedArray = SpinArray<double>;

/// Integer spin resolved array (equivalence ids)
using SpinIndexArray = SpinArray<int>;

}  // namespace tbscc::data
