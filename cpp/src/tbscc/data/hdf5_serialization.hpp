// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <tbscc/data/spin_array.hpp>
#include <vector>

namespace tbscc::data {

/**
 * @brief Native HDF5 type of a C++ element type
 */
template <typename T>
struct h5_native_type;

#define TBSCC_H5_NATIVE_TYPE(type, pred_type) \
  template <>                                 \
  struct h5_native_type<type> {               \
    static auto value() { return pred_type; } \
  };

TBSCC_H5_NATIVE_TYPE(int, H5::PredType::NATIVE_INT)
TBSCC_H5_NATIVE_TYPE(unsigned long, H5::PredType::NATIVE_ULONG)
TBSCC_H5_NATIVE_TYPE(double, H5::PredType::NATIVE_DOUBLE)

#undef TBSCC_H5_NATIVE_TYPE

/// Write a vector as a one dimensional dataset
void write_vector(H5::Group& group, const std::string& name,
                  const Eigen::VectorXd& vector);

/// Read a one dimensional double dataset
Eigen::VectorXd read_vector(H5::Group& group, const std::string& name);

/// Write a std::vector as a one dimensional dataset
template <typename T>
void write_std_vector(H5::Group& group, const std::string& name,
                      const std::vector<T>& data) {
  const auto type = h5_native_type<T>::value();
  hsize_t dims[1] = {data.size()};
  H5::DataSpace space(1, dims);
  H5::DataSet dataset = group.createDataSet(name, type, space);
  if (!data.empty()) {
    dataset.write(data.data(), type);
  }
}

/// Read a one dimensional dataset into a std::vector
template <typename T>
std::vector<T> read_std_vector(H5::Group& group, const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  std::vector<T> data(
      static_cast<size_t>(dataset.getSpace().getSimpleExtentNpoints()));
  if (!data.empty()) {
    dataset.read(data.data(), h5_native_type<T>::value());
  }
  return data;
}

/**
 * @brief Write a spin array as a flat dataset with a "shape" attribute
 *
 * The attribute lists the leading extents followed by the spin count.
 */
template <typename T>
void write_spin_array(H5::Group& group, const std::string& name,
                      const SpinArray<T>& array) {
  const auto type = h5_native_type<T>::value();
  hsize_t dims[1] = {static_cast<hsize_t>(array.size())};
  H5::DataSpace space(1, dims);
  H5::DataSet dataset = group.createDataSet(name, type, space);
  if (array.size() > 0) {
    dataset.write(array.data().data(), type);
  }
  const auto full_shape = array.shape();
  const std::vector<unsigned long> shape(full_shape.begin(), full_shape.end());
  hsize_t shape_dims[1] = {shape.size()};
  H5::DataSpace shape_space(1, shape_dims);
  H5::Attribute attribute = dataset.createAttribute(
      "shape", H5::PredType::NATIVE_ULONG, shape_space);
  attribute.write(H5::PredType::NATIVE_ULONG, shape.data());
}

/**
 * @brief Read a spin array written by write_spin_array()
 * @throws std::runtime_error if the shape attribute is missing or empty
 */
template <typename T>
SpinArray<T> read_spin_array(H5::Group& group, const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  if (!dataset.attrExists("shape")) {
    throw std::runtime_error("Dataset '" + name + "' has no shape attribute");
  }
  H5::Attribute attribute = dataset.openAttribute("shape");
  std::vector<unsigned long> shape(
      static_cast<size_t>(attribute.getSpace().getSimpleExtentNpoints()));
  if (shape.empty()) {
    throw std::runtime_error("Dataset '" + name + "' has an empty shape");
  }
  attribute.read(H5::PredType::NATIVE_ULONG, shape.data());

  typename SpinArray<T>::Storage values(
      static_cast<Eigen::Index>(dataset.getSpace().getSimpleExtentNpoints()));
  if (values.size() > 0) {
    dataset.read(values.data(), h5_native_type<T>::value());
  }
  const size_t num_spin = shape.back();
  std::vector<size_t> leading(shape.begin(), shape.end() - 1);
  return SpinArray<T>(std::move(leading), num_spin, std::move(values));
}

/// Scalar attributes on a group
void write_attribute(H5::Group& group, const std::string& name, double value);
void write_attribute(H5::Group& group, const std::string& name, int value);
void write_attribute(H5::Group& group, const std::string& name,
                     const std::string& value);

double read_double_attribute(H5::Group& group, const std::string& name);
int read_int_attribute(H5::Group& group, const std::string& name);
std::string read_string_attribute(H5::Group& group, const std::string& name);

bool dataset_exists_in_group(H5::Group& group, const std::string& name);

}  // namespace tbscc::data
