// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

namespace H5 {
class Group;
}

#include <concepts>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

namespace diven::data {

/**
 * @brief Common interface of all DivEn data classes
 *
 * Data classes are persisted as JSON or HDF5. File names carry the snake_case
 * data type name in front of the extension, e.g.
 * `hdo.vibrational_basis.json`.
 */
class DataClass {
 public:
  virtual ~DataClass() = default;

  /**
   * @brief Data type name used in file names and serialized "type" fields
   * @return snake_case type name, e.g. "vibrational_basis"
   */
  virtual std::string get_data_type_name() const = 0;

  /**
   * @brief One-line human readable description of the object
   */
  virtual std::string get_summary() const = 0;

  /**
   * @brief Save the object in the requested format
   * @param filename Output path carrying the data type suffix
   * @param type Format, "json" or "hdf5" (some classes also accept "txt")
   * @throws std::invalid_argument for an unsupported format or filename
   * @throws std::runtime_error on I/O failure
   */
  virtual void to_file(const std::string& filename,
                       const std::string& type) const = 0;

  /**
   * @brief Serialize to a JSON object
   */
  virtual nlohmann::json to_json() const = 0;

  /**
   * @brief Save to a JSON file
   * @throws std::runtime_error on I/O failure
   */
  virtual void to_json_file(const std::string& filename) const = 0;

  /**
   * @brief Write into an open HDF5 group
   * @throws std::runtime_error on I/O failure
   */
  virtual void to_hdf5(H5::Group& group) const = 0;

  /**
   * @brief Save to an HDF5 file, replacing any existing file
   * @throws std::runtime_error on I/O failure
   */
  virtual void to_hdf5_file(const std::string& filename) const = 0;

 protected:
  DataClass() = default;
  DataClass(const DataClass& other) = default;
  DataClass& operator=(const DataClass& other) = default;
  DataClass(DataClass&& other) = default;
  DataClass& operator=(DataClass&& other) = default;
};

/**
 * @brief Concept requiring DataClass inheritance plus the static
 * deserialization entry points
 */
template <typename T>
concept DataClassCompliant = std::derived_from<T, DataClass> && requires {
  T::from_file(std::declval<std::string>(), std::declval<std::string>());
} && requires { T::from_json_file(std::declval<std::string>()); } && requires {
  T::from_json(std::declval<nlohmann::json>());
} && requires { T::from_hdf5_file(std::declval<std::string>()); } && requires {
  T::from_hdf5(std::declval<H5::Group&>());
};

}  // namespace diven::data
