// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace diven::data {

/**
 * @brief Whether the HDF5 library's own error stack printing is silenced
 *
 * Set DIVEN_PRINT_VERBOSE_HDF5_ERRORS to 1, true, yes or on to keep it.
 */
inline bool hdf5_errors_should_be_suppressed() {
  const char* env_value = std::getenv("DIVEN_PRINT_VERBOSE_HDF5_ERRORS");
  if (!env_value) {
    return true;
  }

  std::string normalized(env_value);
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  return !(normalized == "1" || normalized == "true" || normalized == "yes" ||
           normalized == "on");
}

}  // namespace diven::data
