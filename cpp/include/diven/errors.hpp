// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <stdexcept>
#include <string>

namespace diven {

/**
 * @brief Exception thrown when the inputs of a calculation are inconsistent
 *
 * Raised for an empty basis, a mode-count mismatch between the anharmonic
 * potential and the basis, or invalid harmonic frequencies.
 */
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& message)
      : std::invalid_argument("Configuration error: " + message) {}
};

/**
 * @brief Exception thrown when an anharmonic term exceeds the supported
 * coupling order and the builder is configured to fail fast
 */
class DomainLimitError : public std::domain_error {
 public:
  explicit DomainLimitError(const std::string& message)
      : std::domain_error("Domain limit exceeded: " + message) {}
};

/**
 * @brief Exception thrown when a long-running calculation was cancelled
 * through its cancellation callback
 */
class CalculationCancelled : public std::runtime_error {
 public:
  explicit CalculationCancelled(const std::string& what_was_cancelled)
      : std::runtime_error("Calculation cancelled: " + what_was_cancelled) {}
};

}  // namespace diven
