// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "hdf5_serialization.hpp"

#include <stdexcept>

namespace diven::data {

namespace {

template <typename Scalar>
void save_dense(H5::Group& group, const std::string& dataset_name,
                const Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic>&
                    matrix) {
  using RowMajor = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic,
                                 Eigen::RowMajor>;
  hsize_t dims[2] = {static_cast<hsize_t>(matrix.rows()),
                     static_cast<hsize_t>(matrix.cols())};
  H5::DataSpace dataspace(2, dims);
  auto data_type = h5_pred_type<Scalar>::value();
  H5::DataSet dataset = group.createDataSet(dataset_name, data_type, dataspace);
  if (matrix.size() > 0) {
    RowMajor row_major = matrix;
    dataset.write(row_major.data(), data_type);
  }
}

template <typename Scalar>
Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic> load_dense(
    H5::Group& group, const std::string& dataset_name) {
  using RowMajor = Eigen::Matrix<Scalar, Eigen::Dynamic, Eigen::Dynamic,
                                 Eigen::RowMajor>;
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 2) {
    throw std::runtime_error("Dataset '" + dataset_name +
                             "' is not two-dimensional");
  }
  hsize_t dims[2] = {0, 0};
  dataspace.getSimpleExtentDims(dims);
  RowMajor row_major(static_cast<Eigen::Index>(dims[0]),
                     static_cast<Eigen::Index>(dims[1]));
  if (row_major.size() > 0) {
    dataset.read(row_major.data(), h5_pred_type<Scalar>::value());
  }
  return row_major;
}

}  // namespace

void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXd& matrix) {
  save_dense<double>(group, dataset_name, matrix);
}

void save_matrix_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::MatrixXi& matrix) {
  save_dense<int>(group, dataset_name, matrix);
}

void save_vector_to_group(H5::Group& group, const std::string& dataset_name,
                          const Eigen::VectorXd& vector) {
  hsize_t dims[1] = {static_cast<hsize_t>(vector.size())};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset =
      group.createDataSet(dataset_name, H5::PredType::NATIVE_DOUBLE, dataspace);
  if (vector.size() > 0) {
    dataset.write(vector.data(), H5::PredType::NATIVE_DOUBLE);
  }
}

void save_string_vector_to_group(H5::Group& group,
                                 const std::string& dataset_name,
                                 const std::vector<std::string>& strings) {
  std::vector<const char*> pointers;
  pointers.reserve(strings.size());
  for (const auto& s : strings) {
    pointers.push_back(s.c_str());
  }
  H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
  hsize_t dims[1] = {strings.size()};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset =
      group.createDataSet(dataset_name, string_type, dataspace);
  if (!pointers.empty()) {
    dataset.write(pointers.data(), string_type);
  }
}

Eigen::MatrixXd load_matrix_from_group(H5::Group& group,
                                       const std::string& dataset_name) {
  return load_dense<double>(group, dataset_name);
}

Eigen::MatrixXi load_int_matrix_from_group(H5::Group& group,
                                           const std::string& dataset_name) {
  return load_dense<int>(group, dataset_name);
}

Eigen::VectorXd load_vector_from_group(H5::Group& group,
                                       const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t dims[1] = {0};
  dataspace.getSimpleExtentDims(dims);
  Eigen::VectorXd vector(static_cast<Eigen::Index>(dims[0]));
  if (dims[0] > 0) {
    dataset.read(vector.data(), H5::PredType::NATIVE_DOUBLE);
  }
  return vector;
}

std::vector<std::string> load_string_vector_from_group(
    H5::Group& group, const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t dims[1] = {0};
  dataspace.getSimpleExtentDims(dims);
  std::vector<std::string> strings;
  if (dims[0] == 0) {
    return strings;
  }

  H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
  std::vector<char*> buffers(dims[0], nullptr);
  dataset.read(buffers.data(), string_type);
  strings.reserve(buffers.size());
  for (char* buffer : buffers) {
    strings.emplace_back(buffer ? buffer : "");
  }
  H5::DataSet::vlenReclaim(buffers.data(), string_type, dataspace);
  return strings;
}

void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value) {
  H5::StrType string_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::Attribute attribute =
      object.createAttribute(name, string_type, H5::DataSpace(H5S_SCALAR));
  attribute.write(string_type, value);
}

std::string read_string_attribute(H5::H5Object& object,
                                  const std::string& name) {
  H5::Attribute attribute = object.openAttribute(name);
  H5::StrType string_type = attribute.getStrType();
  std::string value;
  attribute.read(string_type, value);
  return value;
}

bool dataset_exists_in_group(H5::Group& group,
                             const std::string& dataset_name) {
  return group.nameExists(dataset_name);
}

bool group_exists_in_group(H5::Group& group, const std::string& group_name) {
  return group.nameExists(group_name);
}

}  // namespace diven::data
