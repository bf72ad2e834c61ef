// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cmath>
#include <diven/data/anharmonic_potential.hpp>
#include <diven/errors.hpp>
#include <diven/utils/logger.hpp>
#include <diven/utils/string_utils.hpp>
#include <fstream>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include "data_class_io.hpp"
#include "filename_utils.hpp"

namespace diven::data {

namespace {

// Non-empty, non-comment lines split into whitespace-delimited fields
std::vector<std::vector<std::string>> read_table(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Unable to open text file '" + filename + "'");
  }

  std::vector<std::vector<std::string>> rows;
  std::string line;
  while (std::getline(file, line)) {
    std::istringstream fields(line);
    std::vector<std::string> row;
    std::string field;
    while (fields >> field) {
      row.push_back(field);
    }
    if (row.empty() || row.front().front() == '#') {
      continue;
    }
    rows.push_back(std::move(row));
  }
  if (file.bad()) {
    throw std::runtime_error("Error reading text file '" + filename + "'");
  }
  return rows;
}

double parse_number(const std::string& field, const std::string& filename,
                    size_t row) {
  size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(field, &consumed);
  } catch (const std::logic_error&) {
    consumed = 0;
  }
  if (consumed != field.size()) {
    throw std::runtime_error("Invalid number '" + field + "' in row " +
                             std::to_string(row + 1) + " of '" + filename +
                             "'");
  }
  return value;
}

}  // namespace

int AnharmonicTerm::order() const {
  return std::accumulate(powers.begin(), powers.end(), 0);
}

AnharmonicPotential::AnharmonicPotential(Eigen::VectorXd frequencies,
                                         Eigen::MatrixXi powers,
                                         Eigen::VectorXd coefficients)
    : frequencies_(std::move(frequencies)),
      powers_(std::move(powers)),
      coefficients_(std::move(coefficients)) {
  DIVEN_LOG_TRACE_ENTERING();
  if (powers_.rows() == 0) {
    powers_.resize(0, frequencies_.size());
  }
  _validate();
}

AnharmonicPotential::AnharmonicPotential(
    Eigen::VectorXd frequencies, const std::vector<AnharmonicTerm>& terms)
    : frequencies_(std::move(frequencies)) {
  DIVEN_LOG_TRACE_ENTERING();
  const Eigen::Index num_modes = frequencies_.size();
  powers_.resize(static_cast<Eigen::Index>(terms.size()), num_modes);
  coefficients_.resize(static_cast<Eigen::Index>(terms.size()));
  for (size_t t = 0; t < terms.size(); ++t) {
    const auto& term = terms[t];
    if (static_cast<Eigen::Index>(term.powers.size()) != num_modes) {
      throw ConfigurationError("anharmonic term " + std::to_string(t) +
                               " has " + std::to_string(term.powers.size()) +
                               " powers but the potential has " +
                               std::to_string(num_modes) + " modes");
    }
    for (Eigen::Index m = 0; m < num_modes; ++m) {
      powers_(static_cast<Eigen::Index>(t), m) =
          term.powers[static_cast<size_t>(m)];
    }
    coefficients_(static_cast<Eigen::Index>(t)) = term.coefficient;
  }
  _validate();
}

void AnharmonicPotential::_validate() const {
  if (frequencies_.size() == 0) {
    throw ConfigurationError("at least one harmonic frequency is required");
  }
  for (Eigen::Index i = 0; i < frequencies_.size(); ++i) {
    if (!std::isfinite(frequencies_(i)) || frequencies_(i) <= 0.0) {
      throw ConfigurationError("harmonic frequency " + std::to_string(i) +
                               " must be finite and positive, got " +
                               std::to_string(frequencies_(i)));
    }
  }
  if (powers_.cols() != frequencies_.size()) {
    throw ConfigurationError(
        "anharmonic terms have " + std::to_string(powers_.cols()) +
        " powers but the potential has " +
        std::to_string(frequencies_.size()) + " modes");
  }
  if (powers_.rows() != coefficients_.size()) {
    throw ConfigurationError("found " + std::to_string(powers_.rows()) +
                             " power rows for " +
                             std::to_string(coefficients_.size()) +
                             " coefficients");
  }
  if (powers_.size() > 0 && powers_.minCoeff() < 0) {
    throw std::invalid_argument("Powers of anharmonic terms must be >= 0");
  }
  if (!coefficients_.allFinite()) {
    throw std::invalid_argument("Anharmonic coefficients must be finite");
  }
}

AnharmonicTerm AnharmonicPotential::get_term(size_t index) const {
  if (index >= get_num_terms()) {
    throw std::out_of_range("Term index " + std::to_string(index) +
                            " out of range for " +
                            std::to_string(get_num_terms()) + " terms");
  }
  const auto row = static_cast<Eigen::Index>(index);
  AnharmonicTerm term;
  term.powers.resize(get_num_modes());
  for (Eigen::Index m = 0; m < powers_.cols(); ++m) {
    term.powers[static_cast<size_t>(m)] = powers_(row, m);
  }
  term.coefficient = coefficients_(row);
  return term;
}

std::vector<AnharmonicTerm> AnharmonicPotential::get_terms() const {
  std::vector<AnharmonicTerm> terms;
  terms.reserve(get_num_terms());
  for (size_t t = 0; t < get_num_terms(); ++t) {
    terms.push_back(get_term(t));
  }
  return terms;
}

int AnharmonicPotential::get_max_power() const {
  return powers_.size() > 0 ? powers_.maxCoeff() : 0;
}

int AnharmonicPotential::get_max_order() const {
  return powers_.rows() > 0 ? powers_.rowwise().sum().maxCoeff() : 0;
}

Eigen::VectorXd AnharmonicPotential::read_frequencies(
    const std::string& filename) {
  DIVEN_LOG_TRACE_ENTERING();
  const auto rows = read_table(filename);
  Eigen::VectorXd frequencies(static_cast<Eigen::Index>(rows.size()));
  for (size_t r = 0; r < rows.size(); ++r) {
    frequencies(static_cast<Eigen::Index>(r)) =
        parse_number(rows[r].front(), filename, r);
  }
  DIVEN_LOGGER().debug("Read {} frequencies from {}", rows.size(), filename);
  return frequencies;
}

std::pair<Eigen::MatrixXi, Eigen::VectorXd>
AnharmonicPotential::read_anharmonic_terms(const std::string& filename) {
  DIVEN_LOG_TRACE_ENTERING();
  const auto rows = read_table(filename);
  if (rows.empty()) {
    return {Eigen::MatrixXi(), Eigen::VectorXd()};
  }

  const size_t num_columns = rows.front().size();
  if (num_columns < 2) {
    throw std::runtime_error("Anharmonic term table '" + filename +
                             "' needs at least one power column and a "
                             "coefficient column");
  }
  const auto num_modes = static_cast<Eigen::Index>(num_columns - 1);
  const auto num_terms = static_cast<Eigen::Index>(rows.size());

  Eigen::MatrixXi powers(num_terms, num_modes);
  Eigen::VectorXd coefficients(num_terms);
  for (size_t r = 0; r < rows.size(); ++r) {
    const auto& row = rows[r];
    if (row.size() != num_columns) {
      throw std::runtime_error("Row " + std::to_string(r + 1) + " of '" +
                               filename + "' has " +
                               std::to_string(row.size()) +
                               " columns, expected " +
                               std::to_string(num_columns));
    }
    const auto t = static_cast<Eigen::Index>(r);
    for (Eigen::Index m = 0; m < num_modes; ++m) {
      const double power = parse_number(row[static_cast<size_t>(m)], filename, r);
      if (power < 0.0 || power != std::floor(power)) {
        throw std::runtime_error("Power '" + row[static_cast<size_t>(m)] +
                                 "' in row " + std::to_string(r + 1) +
                                 " of '" + filename +
                                 "' is not a non-negative integer");
      }
      powers(t, m) = static_cast<int>(power);
    }
    coefficients(t) = parse_number(row.back(), filename, r);
  }
  DIVEN_LOGGER().debug("Read {} anharmonic terms over {} modes from {}",
                       num_terms, num_modes, filename);
  return {std::move(powers), std::move(coefficients)};
}

std::shared_ptr<AnharmonicPotential> AnharmonicPotential::from_text_files(
    const std::string& frequencies_file, const std::string& terms_file) {
  DIVEN_LOG_TRACE_ENTERING();
  Eigen::VectorXd frequencies = read_frequencies(frequencies_file);
  auto [powers, coefficients] = read_anharmonic_terms(terms_file);
  if (powers.rows() > 0 && powers.cols() != frequencies.size()) {
    throw ConfigurationError("'" + terms_file + "' describes " +
                             std::to_string(powers.cols()) + " modes but '" +
                             frequencies_file + "' lists " +
                             std::to_string(frequencies.size()) +
                             " frequencies");
  }
  return std::make_shared<AnharmonicPotential>(
      std::move(frequencies), std::move(powers), std::move(coefficients));
}

std::string AnharmonicPotential::get_data_type_name() const {
  return DATACLASS_TO_SNAKE_CASE(AnharmonicPotential);
}

std::string AnharmonicPotential::get_summary() const {
  std::ostringstream oss;
  oss << "AnharmonicPotential(modes: " << get_num_modes()
      << ", terms: " << get_num_terms() << ", max order: " << get_max_order()
      << ", zero-point energy: " << get_zero_point_energy() << ")";
  return oss.str();
}

void AnharmonicPotential::to_file(const std::string& filename,
                                  const std::string& type) const {
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unsupported file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

nlohmann::json AnharmonicPotential::to_json() const {
  nlohmann::json j;
  write_json_header(j, SERIALIZATION_VERSION, get_data_type_name());
  j["frequencies"] = vector_to_json(frequencies_);
  j["powers"] = matrix_to_json(powers_);
  j["coefficients"] = vector_to_json(coefficients_);
  return j;
}

void AnharmonicPotential::to_json_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_json_file(filename, to_json());
}

void AnharmonicPotential::to_hdf5(H5::Group& group) const {
  write_hdf5_header(group, SERIALIZATION_VERSION, get_data_type_name());
  save_vector_to_group(group, "frequencies", frequencies_);
  save_matrix_to_group(group, "powers", powers_);
  save_vector_to_group(group, "coefficients", coefficients_);
}

void AnharmonicPotential::to_hdf5_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_hdf5_file(filename, [this](H5::Group& root) { to_hdf5(root); });
}

std::shared_ptr<AnharmonicPotential> AnharmonicPotential::from_file(
    const std::string& filename, const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unsupported file type: " + type +
                              ". Supported types are: json, hdf5");
}

std::shared_ptr<AnharmonicPotential> AnharmonicPotential::from_json(
    const nlohmann::json& j) {
  check_json_header(j, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(AnharmonicPotential));
  try {
    return std::make_shared<AnharmonicPotential>(
        json_to_vector(j.at("frequencies")),
        json_to_int_matrix(j.at("powers")),
        json_to_vector(j.at("coefficients")));
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(
        std::string("Invalid AnharmonicPotential JSON: ") + e.what());
  }
}

std::shared_ptr<AnharmonicPotential> AnharmonicPotential::from_json_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(AnharmonicPotential));
  return from_json(read_json_file(filename, "AnharmonicPotential"));
}

std::shared_ptr<AnharmonicPotential> AnharmonicPotential::from_hdf5(
    H5::Group& group) {
  check_hdf5_header(group, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(AnharmonicPotential));
  return std::make_shared<AnharmonicPotential>(
      load_vector_from_group(group, "frequencies"),
      load_int_matrix_from_group(group, "powers"),
      load_vector_from_group(group, "coefficients"));
}

std::shared_ptr<AnharmonicPotential> AnharmonicPotential::from_hdf5_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(AnharmonicPotential));
  return read_hdf5_file(filename, "AnharmonicPotential",
                        [](H5::Group& root) { return from_hdf5(root); });
}

}  // namespace diven::data
