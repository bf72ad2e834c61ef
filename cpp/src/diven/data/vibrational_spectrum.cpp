// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <diven/data/vibrational_basis.hpp>
#include <diven/data/vibrational_spectrum.hpp>
#include <diven/utils/string_utils.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "data_class_io.hpp"
#include "filename_utils.hpp"

namespace diven::data {

VibrationalSpectrum::VibrationalSpectrum(Eigen::MatrixXi quantum_numbers,
                                         Eigen::VectorXd energies,
                                         Eigen::MatrixXd eigenvectors,
                                         std::vector<size_t> assignments,
                                         double reference_energy,
                                         size_t num_ambiguous_assignments)
    : quantum_numbers_(std::move(quantum_numbers)),
      energies_(std::move(energies)),
      eigenvectors_(std::move(eigenvectors)),
      assignments_(std::move(assignments)),
      reference_energy_(reference_energy),
      num_ambiguous_assignments_(num_ambiguous_assignments) {
  _validate();
}

void VibrationalSpectrum::_validate() const {
  const Eigen::Index levels = energies_.size();
  if (quantum_numbers_.rows() != levels ||
      static_cast<Eigen::Index>(assignments_.size()) != levels) {
    throw std::invalid_argument(
        "VibrationalSpectrum needs one label and one assignment per level: " +
        std::to_string(levels) + " energies, " +
        std::to_string(quantum_numbers_.rows()) + " labels, " +
        std::to_string(assignments_.size()) + " assignments");
  }
  if (eigenvectors_.size() > 0 && eigenvectors_.cols() != levels) {
    throw std::invalid_argument("Expected " + std::to_string(levels) +
                                " eigenvector columns, got " +
                                std::to_string(eigenvectors_.cols()));
  }
}

Eigen::VectorXd VibrationalSpectrum::get_absolute_energies() const {
  return (energies_.array() + reference_energy_).matrix();
}

std::vector<int> VibrationalSpectrum::get_quantum_numbers(size_t index) const {
  if (index >= get_num_levels()) {
    throw std::out_of_range("Level index " + std::to_string(index) +
                            " out of range for " +
                            std::to_string(get_num_levels()) + " levels");
  }
  const auto row = static_cast<Eigen::Index>(index);
  std::vector<int> labels(get_num_modes());
  for (Eigen::Index m = 0; m < quantum_numbers_.cols(); ++m) {
    labels[static_cast<size_t>(m)] = quantum_numbers_(row, m);
  }
  return labels;
}

size_t VibrationalSpectrum::get_assignment(size_t index) const {
  if (index >= get_num_levels()) {
    throw std::out_of_range("Level index " + std::to_string(index) +
                            " out of range for " +
                            std::to_string(get_num_levels()) + " levels");
  }
  return assignments_[index];
}

std::optional<size_t> VibrationalSpectrum::find_level(
    const std::vector<int>& quantum_numbers) const {
  for (size_t i = 0; i < get_num_levels(); ++i) {
    if (get_quantum_numbers(i) == quantum_numbers) {
      return i;
    }
  }
  return std::nullopt;
}

std::string VibrationalSpectrum::to_table() const {
  return format_state_table(quantum_numbers_, energies_);
}

void VibrationalSpectrum::to_text_file(const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + filename);
  }
  file << to_table();
  if (file.fail()) {
    throw std::runtime_error("Failed to write to file: " + filename);
  }
}

std::string VibrationalSpectrum::get_data_type_name() const {
  return DATACLASS_TO_SNAKE_CASE(VibrationalSpectrum);
}

std::string VibrationalSpectrum::get_summary() const {
  std::ostringstream oss;
  oss << "VibrationalSpectrum(levels: " << get_num_levels()
      << ", reference energy: " << reference_energy_
      << ", ambiguous assignments: " << num_ambiguous_assignments_ << ")";
  return oss.str();
}

void VibrationalSpectrum::to_file(const std::string& filename,
                                  const std::string& type) const {
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else if (type == "txt") {
    DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
    to_text_file(filename);
  } else {
    throw std::invalid_argument("Unsupported file type: " + type +
                                ". Supported types are: json, hdf5, txt");
  }
}

nlohmann::json VibrationalSpectrum::to_json() const {
  nlohmann::json j;
  write_json_header(j, SERIALIZATION_VERSION, get_data_type_name());
  j["num_modes"] = get_num_modes();
  j["quantum_numbers"] = matrix_to_json(quantum_numbers_);
  j["energies"] = vector_to_json(energies_);
  j["eigenvectors"] = matrix_to_json(eigenvectors_);
  j["assignments"] = vector_to_json(assignments_);
  j["reference_energy"] = reference_energy_;
  j["num_ambiguous_assignments"] = num_ambiguous_assignments_;
  return j;
}

void VibrationalSpectrum::to_json_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_json_file(filename, to_json());
}

void VibrationalSpectrum::to_hdf5(H5::Group& group) const {
  write_hdf5_header(group, SERIALIZATION_VERSION, get_data_type_name());
  write_scalar_attribute(group, "reference_energy", reference_energy_);
  write_scalar_attribute(group, "num_ambiguous_assignments",
                         static_cast<unsigned long>(num_ambiguous_assignments_));
  save_matrix_to_group(group, "quantum_numbers", quantum_numbers_);
  save_vector_to_group(group, "energies", energies_);
  save_matrix_to_group(group, "eigenvectors", eigenvectors_);
  std::vector<unsigned long> assignments(assignments_.begin(),
                                         assignments_.end());
  save_stl_to_group(group, "assignments", assignments);
}

void VibrationalSpectrum::to_hdf5_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_hdf5_file(filename, [this](H5::Group& root) { to_hdf5(root); });
}

std::shared_ptr<VibrationalSpectrum> VibrationalSpectrum::from_file(
    const std::string& filename, const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unsupported file type: " + type +
                              ". Supported types are: json, hdf5");
}

std::shared_ptr<VibrationalSpectrum> VibrationalSpectrum::from_json(
    const nlohmann::json& j) {
  check_json_header(j, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(VibrationalSpectrum));
  try {
    Eigen::MatrixXi quantum_numbers =
        json_to_int_matrix(j.at("quantum_numbers"));
    if (quantum_numbers.rows() == 0) {
      quantum_numbers.resize(0, j.at("num_modes").get<Eigen::Index>());
    }
    return std::make_shared<VibrationalSpectrum>(
        std::move(quantum_numbers), json_to_vector(j.at("energies")),
        json_to_matrix(j.at("eigenvectors")),
        json_to_vector<size_t>(j.at("assignments")),
        j.at("reference_energy").get<double>(),
        j.value("num_ambiguous_assignments", size_t{0}));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Invalid VibrationalSpectrum JSON: ") +
                             e.what());
  }
}

std::shared_ptr<VibrationalSpectrum> VibrationalSpectrum::from_json_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(VibrationalSpectrum));
  return from_json(read_json_file(filename, "VibrationalSpectrum"));
}

std::shared_ptr<VibrationalSpectrum> VibrationalSpectrum::from_hdf5(
    H5::Group& group) {
  check_hdf5_header(group, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(VibrationalSpectrum));
  auto assignments =
      load_std_vector_from_group<unsigned long>(group, "assignments");
  return std::make_shared<VibrationalSpectrum>(
      load_int_matrix_from_group(group, "quantum_numbers"),
      load_vector_from_group(group, "energies"),
      load_matrix_from_group(group, "eigenvectors"),
      std::vector<size_t>(assignments.begin(), assignments.end()),
      read_scalar_attribute<double>(group, "reference_energy"),
      static_cast<size_t>(read_scalar_attribute<unsigned long>(
          group, "num_ambiguous_assignments")));
}

std::shared_ptr<VibrationalSpectrum> VibrationalSpectrum::from_hdf5_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(VibrationalSpectrum));
  return read_hdf5_file(filename, "VibrationalSpectrum",
                        [](H5::Group& root) { return from_hdf5(root); });
}

}  // namespace diven::data
