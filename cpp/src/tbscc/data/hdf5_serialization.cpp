// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "hdf5_serialization.hpp"

namespace tbscc::data {

void write_vector(H5::Group& group, const std::string& name,
                  const Eigen::VectorXd& vector) {
  hsize_t dims[1] = {static_cast<hsize_t>(vector.size())};
  H5::DataSpace space(1, dims);
  H5::DataSet dataset =
      group.createDataSet(name, H5::PredType::NATIVE_DOUBLE, space);
  if (vector.size() > 0) {
    dataset.write(vector.data(), H5::PredType::NATIVE_DOUBLE);
  }
}

Eigen::VectorXd read_vector(H5::Group& group, const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  Eigen::VectorXd vector(
      static_cast<Eigen::Index>(dataset.getSpace().getSimpleExtentNpoints()));
  if (vector.size() > 0) {
    dataset.read(vector.data(), H5::PredType::NATIVE_DOUBLE);
  }
  return vector;
}

void write_attribute(H5::Group& group, const std::string& name, double value) {
  H5::Attribute attribute = group.createAttribute(
      name, H5::PredType::NATIVE_DOUBLE, H5::DataSpace(H5S_SCALAR));
  attribute.write(H5::PredType::NATIVE_DOUBLE, &value);
}

void write_attribute(H5::Group& group, const std::string& name, int value) {
  H5::Attribute attribute = group.createAttribute(
      name, H5::PredType::NATIVE_INT, H5::DataSpace(H5S_SCALAR));
  attribute.write(H5::PredType::NATIVE_INT, &value);
}

void write_attribute(H5::Group& group, const std::string& name,
                     const std::string& value) {
  H5::StrType type(H5::PredType::C_S1, value.empty() ? 1 : value.size());
  H5::Attribute attribute =
      group.createAttribute(name, type, H5::DataSpace(H5S_SCALAR));
  attribute.write(type, value);
}

double read_double_attribute(H5::Group& group, const std::string& name) {
  double value = 0.0;
  group.openAttribute(name).read(H5::PredType::NATIVE_DOUBLE, &value);
  return value;
}

int read_int_attribute(H5::Group& group, const std::string& name) {
  int value = 0;
  group.openAttribute(name).read(H5::PredType::NATIVE_INT, &value);
  return value;
}

std::string read_string_attribute(H5::Group& group, const std::string& name) {
  H5::Attribute attribute = group.openAttribute(name);
  std::string value;
  attribute.read(attribute.getStrType(), value);
  return value;
}

bool dataset_exists_in_group(H5::Group& group, const std::string& name) {
  return group.nameExists(name);
}

}  // namespace tbscc::data
