// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <stdexcept>
#include <string>

namespace diven::data {

/**
 * @brief Checks that file names carry the data type in front of the
 * extension, e.g. "hdo.vibrational_basis.h5"
 */
class DataTypeFilename {
 public:
  /**
   * @brief Validate the data type suffix of a file about to be written
   * @param filename File name to check
   * @param data_type Expected snake_case data type
   * @return @p filename unchanged
   * @throws std::invalid_argument if the data type suffix is missing or wrong
   */
  static std::string validate_write_suffix(const std::string& filename,
                                           const std::string& data_type) {
    _check(filename, data_type);
    return filename;
  }

  /**
   * @brief Validate the data type suffix of a file about to be read
   * @copydetails validate_write_suffix
   */
  static std::string validate_read_suffix(const std::string& filename,
                                          const std::string& data_type) {
    _check(filename, data_type);
    return filename;
  }

 private:
  static void _check(const std::string& filename,
                     const std::string& data_type) {
    const std::string dotted = "." + data_type;
    size_t last_dot = filename.find_last_of('.');
    if (last_dot == std::string::npos) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' must have '" + dotted + "' suffix");
    }
    // "name.data_type" without a format extension
    if (filename.size() > dotted.size() &&
        filename.compare(filename.size() - dotted.size(), dotted.size(),
                         dotted) == 0) {
      return;
    }

    std::string base = filename.substr(0, last_dot);
    size_t type_dot = base.find_last_of('.');
    if (type_dot == std::string::npos) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' must have '" + dotted +
                                  ".' before the file extension");
    }

    std::string file_data_type = base.substr(type_dot + 1);
    if (file_data_type != data_type) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' has wrong data type '" + file_data_type +
                                  "', expected '" + data_type + "'");
    }
  }
};

}  // namespace diven::data
