// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <diven/data/data_class.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace diven::data {

/**
 * @class VibrationalSpectrum
 * @brief Assigned vibrational levels from a variational calculation
 *
 * Level i carries the label of basis state get_assignment(i), an energy
 * relative to the reference energy and its eigenvector (column i). Levels
 * are ordered by assigned basis index. When several eigenvectors claimed
 * the same basis state the assignment was ambiguous; their number is kept
 * in get_num_ambiguous_assignments().
 */
class VibrationalSpectrum
    : public DataClass,
      public std::enable_shared_from_this<VibrationalSpectrum> {
 public:
  /**
   * @param quantum_numbers L x M labels, row i for level i
   * @param energies L energies relative to @p reference_energy
   * @param eigenvectors N x L eigenvectors in the basis, column i for level i
   * @param assignments Basis index assigned to each level
   * @param reference_energy Energy subtracted from the eigenvalues
   * @param num_ambiguous_assignments Number of conflicting claims resolved
   * during assignment
   * @throws std::invalid_argument if the sizes disagree
   */
  VibrationalSpectrum(Eigen::MatrixXi quantum_numbers, Eigen::VectorXd energies,
                      Eigen::MatrixXd eigenvectors,
                      std::vector<size_t> assignments, double reference_energy,
                      size_t num_ambiguous_assignments = 0);

  VibrationalSpectrum(const VibrationalSpectrum&) = default;
  VibrationalSpectrum(VibrationalSpectrum&&) noexcept = default;
  VibrationalSpectrum& operator=(const VibrationalSpectrum&) = default;
  VibrationalSpectrum& operator=(VibrationalSpectrum&&) noexcept = default;
  virtual ~VibrationalSpectrum() = default;

  size_t get_num_levels() const {
    return static_cast<size_t>(energies_.size());
  }

  size_t get_num_modes() const {
    return static_cast<size_t>(quantum_numbers_.cols());
  }

  /// Energies relative to the reference energy
  const Eigen::VectorXd& get_energies() const { return energies_; }

  /// Eigenvalues, i.e. relative energies plus the reference energy
  Eigen::VectorXd get_absolute_energies() const;

  double get_reference_energy() const { return reference_energy_; }

  const Eigen::MatrixXd& get_eigenvectors() const { return eigenvectors_; }

  const Eigen::MatrixXi& get_quantum_numbers() const {
    return quantum_numbers_;
  }

  /**
   * @brief Label of level @p index
   * @throws std::out_of_range if @p index >= get_num_levels()
   */
  std::vector<int> get_quantum_numbers(size_t index) const;

  const std::vector<size_t>& get_assignments() const { return assignments_; }

  /**
   * @brief Basis index assigned to level @p index
   * @throws std::out_of_range if @p index >= get_num_levels()
   */
  size_t get_assignment(size_t index) const;

  size_t get_num_ambiguous_assignments() const {
    return num_ambiguous_assignments_;
  }

  /// First level labeled with @p quantum_numbers, if any
  std::optional<size_t> find_level(const std::vector<int>& quantum_numbers) const;

  /**
   * @brief Fixed-width listing, one line per level: each quantum number as
   * %4d followed by the relative energy as %24.16f
   */
  std::string to_table() const;

  /// Write to_table() to a file
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

  static std::shared_ptr<VibrationalSpectrum> from_file(
      const std::string& filename, const std::string& type);

  static std::shared_ptr<VibrationalSpectrum> from_json(
      const nlohmann::json& j);

  static std::shared_ptr<VibrationalSpectrum> from_json_file(
      const std::string& filename);

  static std::shared_ptr<VibrationalSpectrum> from_hdf5(H5::Group& group);

  static std::shared_ptr<VibrationalSpectrum> from_hdf5_file(
      const std::string& filename);

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  void _validate() const;

  Eigen::MatrixXi quantum_numbers_;
  Eigen::VectorXd energies_;
  Eigen::MatrixXd eigenvectors_;
  std::vector<size_t> assignments_;
  double reference_energy_ = 0.0;
  size_t num_ambiguous_assignments_ = 0;
};

static_assert(DataClassCompliant<VibrationalSpectrum>,
              "VibrationalSpectrum must derive from DataClass and implement "
              "all required deserialization methods");

}  // namespace diven::data
