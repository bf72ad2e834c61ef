// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <string>

namespace diven::utils {

/**
 * @brief Convert a PascalCase identifier to snake_case
 *
 * An underscore is inserted before every upper-case letter except the first
 * and all letters are lowered, e.g. "VibrationalBasis" becomes
 * "vibrational_basis".
 *
 * @param input Null-terminated PascalCase string
 * @return The snake_case form
 */
inline std::string to_snake_case(const char* input) {
  std::string result;
  for (std::size_t i = 0; input[i] != '\0'; ++i) {
    const char c = input[i];
    if (c >= 'A' && c <= 'Z') {
      if (i > 0) {
        result += '_';
      }
      result += static_cast<char>(c - 'A' + 'a');
    } else {
      result += c;
    }
  }
  return result;
}

/**
 * @def DATACLASS_TO_SNAKE_CASE
 * @brief Data type name of a data class, used as the filename suffix
 *
 * The conversion runs once per call site.
 *
 * @code
 * std::string get_data_type_name() const override {
 *   return DATACLASS_TO_SNAKE_CASE(VibrationalBasis);  // "vibrational_basis"
 * }
 * @endcode
 */
#define DATACLASS_TO_SNAKE_CASE(ClassName)         \
  ([]() -> const char* {                           \
    static const std::string result =              \
        ::diven::utils::to_snake_case(#ClassName); \
    return result.c_str();                         \
  }())

}  // namespace diven::utils
