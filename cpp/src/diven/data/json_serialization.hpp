// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

namespace diven::data {

/**
 * @file json_serialization.hpp
 * @brief JSON helpers shared by the data classes: Eigen arrays and
 * serialization version checks
 */

/**
 * @brief Check that serialized data was written by a compatible version
 *
 * Major and minor must match, patch differences are accepted.
 *
 * @param expected_version Version written by this code, e.g. "0.1.0"
 * @param found_version Version read from the data
 * @throws std::runtime_error on an incompatible version
 */
void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version);

/**
 * @brief Split "major.minor.patch" into its components
 * @throws std::runtime_error if the string is malformed
 */
std::tuple<int, int, int> parse_version_string(
    const std::string& version_string);

/// Row-major nested array
nlohmann::json matrix_to_json(const Eigen::MatrixXd& matrix);

/// Row-major nested array
nlohmann::json matrix_to_json(const Eigen::MatrixXi& matrix);

nlohmann::json vector_to_json(const Eigen::VectorXd& vector);

/**
 * @brief Read a row-major nested array
 * @param j Array of equally long arrays; an empty array gives a 0x0 matrix
 * @throws std::invalid_argument if rows are ragged or j is not an array
 */
Eigen::MatrixXd json_to_matrix(const nlohmann::json& j);

/// @copydoc json_to_matrix
Eigen::MatrixXi json_to_int_matrix(const nlohmann::json& j);

/**
 * @brief Read a flat array of numbers
 * @throws std::invalid_argument if j is not an array
 */
Eigen::VectorXd json_to_vector(const nlohmann::json& j);

template <typename T>
nlohmann::json vector_to_json(const std::vector<T>& vector) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto& element : vector) {
    j.push_back(element);
  }
  return j;
}

template <typename T>
std::vector<T> json_to_vector(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for vector conversion");
  }
  std::vector<T> vector;
  vector.reserve(j.size());
  for (const auto& element : j) {
    vector.push_back(element.get<T>());
  }
  return vector;
}

}  // namespace diven::data
