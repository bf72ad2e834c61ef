// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>

#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>

#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace diven::data {

/**
 * @file data_class_io.hpp
 * @brief File plumbing shared by the data classes: headers carrying the
 * serialization version and type, and exception translation for HDF5
 */

/// Write the "serialization_version" and "type" fields
inline void write_json_header(nlohmann::json& j, const std::string& version,
                              const std::string& type) {
  j["serialization_version"] = version;
  j["type"] = type;
}

/**
 * @brief Check the "serialization_version" and "type" fields, when present
 * @throws std::runtime_error on a version or type mismatch
 */
inline void check_json_header(const nlohmann::json& j,
                              const std::string& version,
                              const std::string& type) {
  if (!j.is_object()) {
    throw std::runtime_error("Invalid " + type + " JSON: expected an object");
  }
  if (j.contains("serialization_version")) {
    validate_serialization_version(
        version, j["serialization_version"].get<std::string>());
  }
  if (j.contains("type") && j["type"].get<std::string>() != type) {
    throw std::runtime_error("Invalid type in JSON data: expected '" + type +
                             "', found '" + j["type"].get<std::string>() +
                             "'");
  }
}

inline void write_hdf5_header(H5::Group& group, const std::string& version,
                              const std::string& type) {
  write_string_attribute(group, "serialization_version", version);
  write_string_attribute(group, "type", type);
}

/// @copydoc check_json_header
inline void check_hdf5_header(H5::Group& group, const std::string& version,
                              const std::string& type) {
  if (group.attrExists("serialization_version")) {
    validate_serialization_version(
        version, read_string_attribute(group, "serialization_version"));
  }
  if (group.attrExists("type")) {
    const std::string found = read_string_attribute(group, "type");
    if (found != type) {
      throw std::runtime_error("Invalid type in HDF5 data: expected '" + type +
                               "', found '" + found + "'");
    }
  }
}

/**
 * @brief Pretty-print JSON to a file
 * @throws std::runtime_error on I/O failure
 */
inline void write_json_file(const std::string& filename,
                            const nlohmann::json& j) {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + filename);
  }
  file << std::setw(2) << j << std::endl;
  if (file.fail()) {
    throw std::runtime_error("Failed to write to file: " + filename);
  }
}

/**
 * @brief Parse a JSON file
 * @param filename File to read
 * @param class_name Used in error messages
 * @throws std::runtime_error if the file cannot be opened or parsed
 */
inline nlohmann::json read_json_file(const std::string& filename,
                                     const std::string& class_name) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Unable to open " + class_name + " JSON file '" +
                             filename +
                             "'. Please check that the file exists and you "
                             "have read permissions.");
  }
  try {
    nlohmann::json j;
    file >> j;
    return j;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("Unable to parse " + class_name + " JSON file '" +
                             filename + "': " + e.what());
  }
}

/**
 * @brief Create (truncate) an HDF5 file and fill its root group
 * @param filename File to create
 * @param writer Callable taking H5::Group&
 * @throws std::runtime_error wrapping any HDF5 failure
 */
template <typename Writer>
void write_hdf5_file(const std::string& filename, Writer&& writer) {
  if (hdf5_errors_should_be_suppressed()) {
    H5::Exception::dontPrint();
  }
  try {
    H5::H5File file(filename, H5F_ACC_TRUNC);
    std::forward<Writer>(writer)(file);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Unable to write HDF5 file '" + filename +
                             "': " + e.getCDetailMsg());
  }
}

/**
 * @brief Open an HDF5 file read-only and decode its root group
 * @param filename File to read
 * @param class_name Used in error messages
 * @param reader Callable taking H5::Group& and returning the decoded object
 * @throws std::runtime_error wrapping any HDF5 failure
 */
template <typename Reader>
auto read_hdf5_file(const std::string& filename, const std::string& class_name,
                    Reader&& reader) {
  if (hdf5_errors_should_be_suppressed()) {
    H5::Exception::dontPrint();
  }

  H5::H5File file;
  try {
    file.openFile(filename, H5F_ACC_RDONLY);
  } catch (const H5::Exception&) {
    throw std::runtime_error("Unable to open " + class_name + " HDF5 file '" +
                             filename +
                             "'. Please check that the file exists, is a "
                             "valid HDF5 file, and you have read permissions.");
  }

  try {
    return std::forward<Reader>(reader)(file);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Unable to read " + class_name +
                             " data from HDF5 file '" + filename +
                             "'. HDF5 error: " + e.getCDetailMsg());
  }
}

}  // namespace diven::data
