// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cmath>
#include <diven/data/perturbation_series.hpp>
#include <diven/utils/string_utils.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "data_class_io.hpp"
#include "filename_utils.hpp"

namespace diven::data {

PerturbationSeries::PerturbationSeries(std::vector<mpf_class> coefficients,
                                       size_t target_index,
                                       std::vector<int> target_quantum_numbers,
                                       double zero_order_energy,
                                       unsigned precision_digits)
    : coefficients_(std::move(coefficients)),
      target_index_(target_index),
      target_quantum_numbers_(std::move(target_quantum_numbers)),
      zero_order_energy_(zero_order_energy),
      precision_digits_(precision_digits) {
  if (precision_digits_ == 0) {
    throw std::invalid_argument(
        "PerturbationSeries precision must be at least one digit");
  }
}

mp_bitcnt_t PerturbationSeries::bits_for_digits(unsigned digits) {
  return static_cast<mp_bitcnt_t>(
             std::ceil(static_cast<double>(digits) * std::log2(10.0))) +
         64;
}

const mpf_class& PerturbationSeries::get_coefficient(size_t k) const {
  if (k >= coefficients_.size()) {
    throw std::out_of_range("Coefficient index " + std::to_string(k) +
                            " out of range for a series of order " +
                            std::to_string(coefficients_.size()));
  }
  return coefficients_[k];
}

Eigen::VectorXd PerturbationSeries::get_coefficients_as_double() const {
  Eigen::VectorXd values(static_cast<Eigen::Index>(coefficients_.size()));
  for (size_t k = 0; k < coefficients_.size(); ++k) {
    values(static_cast<Eigen::Index>(k)) = coefficients_[k].get_d();
  }
  return values;
}

mpf_class PerturbationSeries::partial_sum(size_t num_terms) const {
  if (num_terms > coefficients_.size()) {
    throw std::out_of_range("Cannot sum " + std::to_string(num_terms) +
                            " terms of a series of order " +
                            std::to_string(coefficients_.size()));
  }
  mpf_class sum(0, bits_for_digits(precision_digits_));
  for (size_t k = 0; k < num_terms; ++k) {
    sum += coefficients_[k];
  }
  return sum;
}

double PerturbationSeries::get_energy() const {
  mpf_class energy(zero_order_energy_, bits_for_digits(precision_digits_));
  energy += partial_sum(coefficients_.size());
  return energy.get_d();
}

Eigen::VectorXd PerturbationSeries::get_partial_energies() const {
  Eigen::VectorXd energies(static_cast<Eigen::Index>(coefficients_.size()));
  mpf_class energy(zero_order_energy_, bits_for_digits(precision_digits_));
  for (size_t k = 0; k < coefficients_.size(); ++k) {
    energy += coefficients_[k];
    energies(static_cast<Eigen::Index>(k)) = energy.get_d();
  }
  return energies;
}

std::string PerturbationSeries::coefficient_to_string(size_t k) const {
  std::ostringstream oss;
  oss << std::scientific << std::setprecision(precision_digits_)
      << get_coefficient(k);
  return oss.str();
}

std::vector<std::string> PerturbationSeries::_coefficient_strings() const {
  std::vector<std::string> texts;
  texts.reserve(coefficients_.size());
  for (size_t k = 0; k < coefficients_.size(); ++k) {
    texts.push_back(coefficient_to_string(k));
  }
  return texts;
}

std::vector<mpf_class> PerturbationSeries::_parse_coefficients(
    const std::vector<std::string>& texts, unsigned precision_digits) {
  const mp_bitcnt_t bits = bits_for_digits(precision_digits);
  std::vector<mpf_class> coefficients;
  coefficients.reserve(texts.size());
  for (const auto& text : texts) {
    try {
      coefficients.emplace_back(text, bits);
    } catch (const std::invalid_argument&) {
      throw std::runtime_error("Invalid perturbation coefficient '" + text +
                               "'");
    }
  }
  return coefficients;
}

std::string PerturbationSeries::get_data_type_name() const {
  return DATACLASS_TO_SNAKE_CASE(PerturbationSeries);
}

std::string PerturbationSeries::get_summary() const {
  std::ostringstream oss;
  oss << "PerturbationSeries(target: " << target_index_
      << ", order: " << get_order() << ", digits: " << precision_digits_;
  if (!coefficients_.empty()) {
    oss << ", energy: " << std::setprecision(16) << get_energy();
  }
  oss << ")";
  return oss.str();
}

void PerturbationSeries::to_file(const std::string& filename,
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

nlohmann::json PerturbationSeries::to_json() const {
  nlohmann::json j;
  write_json_header(j, SERIALIZATION_VERSION, get_data_type_name());
  j["target_index"] = target_index_;
  j["target_quantum_numbers"] = vector_to_json(target_quantum_numbers_);
  j["zero_order_energy"] = zero_order_energy_;
  j["precision_digits"] = precision_digits_;
  j["coefficients"] = vector_to_json(_coefficient_strings());
  return j;
}

void PerturbationSeries::to_json_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_json_file(filename, to_json());
}

void PerturbationSeries::to_hdf5(H5::Group& group) const {
  write_hdf5_header(group, SERIALIZATION_VERSION, get_data_type_name());
  write_scalar_attribute(group, "target_index",
                         static_cast<unsigned long>(target_index_));
  write_scalar_attribute(group, "zero_order_energy", zero_order_energy_);
  write_scalar_attribute(group, "precision_digits",
                         static_cast<unsigned long>(precision_digits_));
  save_stl_to_group(group, "target_quantum_numbers", target_quantum_numbers_);
  save_string_vector_to_group(group, "coefficients", _coefficient_strings());
}

void PerturbationSeries::to_hdf5_file(const std::string& filename) const {
  DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  write_hdf5_file(filename, [this](H5::Group& root) { to_hdf5(root); });
}

std::shared_ptr<PerturbationSeries> PerturbationSeries::from_file(
    const std::string& filename, const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unsupported file type: " + type +
                              ". Supported types are: json, hdf5");
}

std::shared_ptr<PerturbationSeries> PerturbationSeries::from_json(
    const nlohmann::json& j) {
  check_json_header(j, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(PerturbationSeries));
  try {
    const auto digits = j.at("precision_digits").get<unsigned>();
    return std::make_shared<PerturbationSeries>(
        _parse_coefficients(
            json_to_vector<std::string>(j.at("coefficients")), digits),
        j.at("target_index").get<size_t>(),
        json_to_vector<int>(j.at("target_quantum_numbers")),
        j.at("zero_order_energy").get<double>(), digits);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Invalid PerturbationSeries JSON: ") +
                             e.what());
  }
}

std::shared_ptr<PerturbationSeries> PerturbationSeries::from_json_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(PerturbationSeries));
  return from_json(read_json_file(filename, "PerturbationSeries"));
}

std::shared_ptr<PerturbationSeries> PerturbationSeries::from_hdf5(
    H5::Group& group) {
  check_hdf5_header(group, SERIALIZATION_VERSION,
                    DATACLASS_TO_SNAKE_CASE(PerturbationSeries));
  const auto digits = static_cast<unsigned>(
      read_scalar_attribute<unsigned long>(group, "precision_digits"));
  return std::make_shared<PerturbationSeries>(
      _parse_coefficients(load_string_vector_from_group(group, "coefficients"),
                          digits),
      static_cast<size_t>(
          read_scalar_attribute<unsigned long>(group, "target_index")),
      load_std_vector_from_group<int>(group, "target_quantum_numbers"),
      read_scalar_attribute<double>(group, "zero_order_energy"), digits);
}

std::shared_ptr<PerturbationSeries> PerturbationSeries::from_hdf5_file(
    const std::string& filename) {
  DataTypeFilename::validate_read_suffix(
      filename, DATACLASS_TO_SNAKE_CASE(PerturbationSeries));
  return read_hdf5_file(filename, "PerturbationSeries",
                        [](H5::Group& root) { return from_hdf5(root); });
}

}  // namespace diven::data
