// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "json_serialization.hpp"

#include <stdexcept>
#include <string>
#include <tuple>

namespace diven::data {

namespace {

template <typename Matrix>
nlohmann::json dense_to_json(const Matrix& matrix) {
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index row = 0; row < matrix.rows(); ++row) {
    nlohmann::json row_array = nlohmann::json::array();
    for (Eigen::Index col = 0; col < matrix.cols(); ++col) {
      row_array.push_back(matrix(row, col));
    }
    j.push_back(std::move(row_array));
  }
  return j;
}

template <typename Matrix>
Matrix json_to_dense(const nlohmann::json& j) {
  using Scalar = typename Matrix::Scalar;
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for matrix conversion");
  }
  if (j.empty()) {
    return Matrix(0, 0);
  }

  const Eigen::Index rows = static_cast<Eigen::Index>(j.size());
  const Eigen::Index cols = static_cast<Eigen::Index>(j[0].size());
  Matrix matrix(rows, cols);
  for (Eigen::Index row = 0; row < rows; ++row) {
    const auto& row_json = j[static_cast<size_t>(row)];
    if (!row_json.is_array() ||
        static_cast<Eigen::Index>(row_json.size()) != cols) {
      throw std::invalid_argument(
          "All rows must have the same length for matrix conversion");
    }
    for (Eigen::Index col = 0; col < cols; ++col) {
      matrix(row, col) = row_json[static_cast<size_t>(col)].get<Scalar>();
    }
  }
  return matrix;
}

}  // namespace

nlohmann::json matrix_to_json(const Eigen::MatrixXd& matrix) {
  return dense_to_json(matrix);
}

nlohmann::json matrix_to_json(const Eigen::MatrixXi& matrix) {
  return dense_to_json(matrix);
}

nlohmann::json vector_to_json(const Eigen::VectorXd& vector) {
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index i = 0; i < vector.size(); ++i) {
    j.push_back(vector(i));
  }
  return j;
}

Eigen::MatrixXd json_to_matrix(const nlohmann::json& j) {
  return json_to_dense<Eigen::MatrixXd>(j);
}

Eigen::MatrixXi json_to_int_matrix(const nlohmann::json& j) {
  return json_to_dense<Eigen::MatrixXi>(j);
}

Eigen::VectorXd json_to_vector(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for vector conversion");
  }

  Eigen::VectorXd vector(static_cast<Eigen::Index>(j.size()));
  for (size_t i = 0; i < j.size(); ++i) {
    vector(static_cast<Eigen::Index>(i)) = j[i].get<double>();
  }
  return vector;
}

std::tuple<int, int, int> parse_version_string(
    const std::string& version_string) {
  const std::string message =
      "Invalid version string format. Expected 'major.minor.patch', got: " +
      version_string;
  size_t first_dot = version_string.find('.');
  if (first_dot == std::string::npos) {
    throw std::runtime_error(message);
  }
  size_t second_dot = version_string.find('.', first_dot + 1);
  if (second_dot == std::string::npos) {
    throw std::runtime_error(message);
  }

  try {
    int major = std::stoi(version_string.substr(0, first_dot));
    int minor = std::stoi(
        version_string.substr(first_dot + 1, second_dot - first_dot - 1));
    int patch = std::stoi(version_string.substr(second_dot + 1));
    return {major, minor, patch};
  } catch (const std::logic_error&) {
    throw std::runtime_error(message);
  }
}

void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version) {
  if (expected_version == found_version) {
    return;
  }

  auto [expected_major, expected_minor, expected_patch] =
      parse_version_string(expected_version);
  auto [found_major, found_minor, found_patch] =
      parse_version_string(found_version);

  if (expected_major != found_major || expected_minor != found_minor) {
    throw std::runtime_error("Incompatible serialization version. Expected: " +
                             expected_version + ", Found: " + found_version +
                             ". Only patch versions may differ.");
  }
}

}  // namespace diven::data
