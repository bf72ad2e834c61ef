// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <diven/data/data_class.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace diven::data {

/**
 * @brief Product of harmonic-oscillator states with its zero-order energy
 */
struct ZeroOrderState {
  std::vector<int> quantum_numbers;  ///< One quantum number per mode
  double energy = 0.0;               ///< Sum of freq_i * (v_i + 1/2)
};

/**
 * @class VibrationalBasis
 * @brief Ordered set of zero-order states spanning a vibrational calculation
 *
 * State i is row i of the N x M quantum number matrix together with its
 * zero-order energy. Matrices built on a basis are indexed by these
 * positions. Bases produced by the enumerator are sorted by energy, then by
 * quantum numbers.
 */
class VibrationalBasis : public DataClass,
                         public std::enable_shared_from_this<VibrationalBasis> {
 public:
  /**
   * @brief Construct from dense arrays
   * @param quantum_numbers N x M matrix of non-negative quantum numbers
   * @param energies N zero-order energies
   * @throws std::invalid_argument if the sizes disagree or a quantum number
   * is negative
   */
  VibrationalBasis(Eigen::MatrixXi quantum_numbers, Eigen::VectorXd energies);

  /**
   * @brief Construct from a list of states sharing the same number of modes
   * @param num_modes Number of modes M
   * @param states States in basis order
   * @throws std::invalid_argument if a state does not have @p num_modes
   * quantum numbers or a quantum number is negative
   */
  VibrationalBasis(size_t num_modes, const std::vector<ZeroOrderState>& states);

  VibrationalBasis(const VibrationalBasis&) = default;
  VibrationalBasis(VibrationalBasis&&) noexcept = default;
  VibrationalBasis& operator=(const VibrationalBasis&) = default;
  VibrationalBasis& operator=(VibrationalBasis&&) noexcept = default;
  virtual ~VibrationalBasis() = default;

  size_t get_num_states() const {
    return static_cast<size_t>(energies_.size());
  }

  size_t get_num_modes() const {
    return static_cast<size_t>(quantum_numbers_.cols());
  }

  bool empty() const { return get_num_states() == 0; }

  /// N x M quantum numbers, one row per state
  const Eigen::MatrixXi& get_quantum_numbers() const {
    return quantum_numbers_;
  }

  const Eigen::VectorXd& get_energies() const { return energies_; }

  /**
   * @brief State @p index
   * @throws std::out_of_range if @p index >= get_num_states()
   */
  ZeroOrderState get_state(size_t index) const;

  /**
   * @brief Position of the state with the given quantum numbers
   * @return The index, or std::nullopt if the state is not in the basis
   */
  std::optional<size_t> find_state(const std::vector<int>& quantum_numbers) const;

  /// Largest quantum number of any mode, 0 for an empty basis
  int get_max_quantum_number() const;

  /**
   * @brief Sub-basis of the states accepted by @p predicate, in their
   * original order and densely reindexed
   *
   * @code
   * // keep states odd in the third mode
   * auto odd = basis->select([](const ZeroOrderState& s) {
   *   return s.quantum_numbers[2] % 2 == 1;
   * });
   * @endcode
   */
  std::shared_ptr<VibrationalBasis> select(
      const std::function<bool(const ZeroOrderState&)>& predicate) const;

  /**
   * @brief Fixed-width listing, one line per state: each quantum number as
   * %4d followed by the energy as %24.16f
   */
  std::string to_table() const;

  /**
   * @brief Write to_table() to a file
   * @throws std::runtime_error on I/O failure
   */
  void to_text_file(const std::string& filename) const;

  // === DataClass interface ===

  std::string get_data_type_name() const override;

  std::string get_summary() const override;

  /// Formats "json", "hdf5" and "txt" (write only)
  void to_file(const std::string& filename,
               const std::string& type) const override;

  nlohmann::json to_json() const override;

  void to_json_file(const std::string& filename) const override;

  void to_hdf5(H5::Group& group) const override;

  void to_hdf5_file(const std::string& filename) const override;

  static std::shared_ptr<VibrationalBasis> from_file(
      const std::string& filename, const std::string& type);

  static std::shared_ptr<VibrationalBasis> from_json(const nlohmann::json& j);

  static std::shared_ptr<VibrationalBasis> from_json_file(
      const std::string& filename);

  static std::shared_ptr<VibrationalBasis> from_hdf5(H5::Group& group);

  static std::shared_ptr<VibrationalBasis> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  void _validate() const;

  Eigen::MatrixXi quantum_numbers_;
  Eigen::VectorXd energies_;
};

static_assert(DataClassCompliant<VibrationalBasis>,
              "VibrationalBasis must derive from DataClass and implement all "
              "required deserialization methods");

/**
 * @brief Fixed-width text rows used by the basis and spectrum listings
 * @param quantum_numbers N x M labels
 * @param energies N energies
 * @return N lines of %4d per label and %24.16f energy
 */
std::string format_state_table(const Eigen::MatrixXi& quantum_numbers,
                               const Eigen::VectorXd& energies);

}  // namespace diven::data
