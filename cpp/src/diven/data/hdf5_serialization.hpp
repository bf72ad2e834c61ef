// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace diven::data {

/**
 * @file hdf5_serialization.hpp
 * @brief HDF5 group helpers shared by the data classes
 *
 * Matrices are stored row-major with dimensions [rows, cols]. H5::H5File
 * derives from H5::Group, so every helper also works on a file root.
 */

template <typename T>
struct h5_pred_type;

#define DIVEN_DECLARE_H5_PRED_TYPE(type, pred_type) \
  template <>                                       \
  struct h5_pred_type<type> {                       \
    static auto value() { return pred_type; }       \
  };

DIVEN_DECLARE_H5_PRED_TYPE(int, H5::PredType::NATIVE_INT)
DIVEN_DECLARE_H5_PRED_TYPE(long, H5::PredType::NATIVE_LONG)
DIVEN_DECLARE_H5_PRED_TYPE(long long, H5::PredType::NATIVE_LLONG)
DIVEN_DECLARE_H5_PRED_TYPE(unsigned long, H5::PredType::NATIVE_ULONG)
DIVEN_DECLARE_H5_PRED_TYPE(double, H5::PredType::NATIVE_DOUBLE)

#undef DIVEN_DECLARE_H5_PRED_TYPE

void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXd& matrix);
void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXi& matrix);
void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::VectorXd& vector);
void save_string_vector_to_group(H5::Group& group,
                                 const std::string& dataset_name,
                                 const std::vector<std::string>& strings);

Eigen::MatrixXd load_matrix_from_group(H5::Group& group,
                                       const std::string& dataset_name);
Eigen::MatrixXi load_int_matrix_from_group(H5::Group& group,
                                           const std::string& dataset_name);
Eigen::VectorXd load_vector_from_group(H5::Group& group,
                                       const std::string& dataset_name);
std::vector<std::string> load_string_vector_from_group(
    H5::Group& group, const std::string& dataset_name);

/// Write a variable-length string attribute on @p object
void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value);

/// Read a variable-length string attribute from @p object
std::string read_string_attribute(H5::H5Object& object,
                                  const std::string& name);

/**
 * @brief Write a scalar attribute of a native numeric type
 */
template <typename T>
void write_scalar_attribute(H5::H5Object& object, const std::string& name,
                            const T& value) {
  H5::Attribute attribute = object.createAttribute(
      name, h5_pred_type<T>::value(), H5::DataSpace(H5S_SCALAR));
  attribute.write(h5_pred_type<T>::value(), &value);
}

/**
 * @brief Read a scalar attribute of a native numeric type
 */
template <typename T>
T read_scalar_attribute(H5::H5Object& object, const std::string& name) {
  T value{};
  H5::Attribute attribute = object.openAttribute(name);
  attribute.read(h5_pred_type<T>::value(), &value);
  return value;
}

template <typename T>
void save_stl_to_group(H5::Group& group, const std::string& dataset_name,
                       const std::vector<T>& data) {
  auto data_type = h5_pred_type<T>::value();
  hsize_t dims[1] = {data.size()};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset = group.createDataSet(dataset_name, data_type, dataspace);
  if (!data.empty()) {
    dataset.write(data.data(), data_type);
  }
}

template <typename T>
std::vector<T> load_std_vector_from_group(H5::Group& group,
                                          const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t dims[1] = {0};
  dataspace.getSimpleExtentDims(dims, nullptr);
  std::vector<T> data(dims[0]);
  if (dims[0] > 0) {
    dataset.read(data.data(), h5_pred_type<T>::value());
  }
  return data;
}

bool dataset_exists_in_group(H5::Group& group, const std::string& dataset_name);
bool group_exists_in_group(H5::Group& group, const std::string& group_name);

}  // namespace diven::data
