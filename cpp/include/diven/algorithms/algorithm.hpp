// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <diven/data/settings.hpp>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace diven::algorithms {

/**
 * @brief Base class of all DivEn algorithms
 *
 * run() locks the settings and forwards its arguments to _run_impl(), so a
 * configured instance cannot be modified once it has been used.
 *
 * @tparam Derived Abstract algorithm interface, e.g. VariationalSolver
 * @tparam ReturnType Result of run()
 * @tparam Args Inputs of run()
 *
 * @code
 * class VariationalSolver
 *     : public Algorithm<VariationalSolver,
 *                        std::shared_ptr<data::VibrationalSpectrum>,
 *                        std::shared_ptr<const data::VibrationalHamiltonian>,
 *                        std::optional<double>> {
 *  protected:
 *   std::shared_ptr<data::VibrationalSpectrum> _run_impl(
 *       std::shared_ptr<const data::VibrationalHamiltonian> hamiltonian,
 *       std::optional<double> reference_energy) const override;
 * };
 * @endcode
 */
template <typename Derived, typename ReturnType, typename... Args>
class Algorithm {
 public:
  Algorithm() = default;
  virtual ~Algorithm() = default;

  /**
   * @brief Lock the settings and run the algorithm
   * @param args Inputs forwarded to _run_impl()
   * @return Result of _run_impl()
   */
  virtual ReturnType run(Args... args) const {
    this->lock_settings();
    return this->_run_impl(std::forward<Args>(args)...);
  }

  /// Mutable access to the settings; throws once locked
  data::Settings& settings() { return *_settings; }

  /// Read-only access to the settings
  const data::Settings& settings() const { return *_settings; }

  /// Registry name of the implementation, e.g. "eigen"
  virtual std::string name() const = 0;

  /// Registry names, primary name first
  virtual std::vector<std::string> aliases() const { return {this->name()}; }

  /// Name of the algorithm interface, e.g. "variational_solver"
  virtual std::string type_name() const = 0;

 protected:
  void lock_settings() const { this->_settings->lock(); }

  virtual ReturnType _run_impl(Args... args) const = 0;

  /// Replaced by implementations with their own Settings subclass
  std::unique_ptr<data::Settings> _settings =
      std::make_unique<data::Settings>();
};

/**
 * @brief Name-keyed registry of the implementations of one algorithm
 * interface
 *
 * Each factory is a struct deriving from this template and providing
 * algorithm_type_name(), default_algorithm_name() and
 * register_default_instances(). The defaults are registered on first use.
 *
 * @code
 * auto solver = VariationalSolverFactory::create();         // default
 * auto reference = PerturbationMatrixBuilderFactory::create("closed_form");
 * @endcode
 *
 * @tparam BaseAlgorithmType Algorithm interface produced by the factory
 * @tparam Derived The concrete factory struct
 */
template <typename BaseAlgorithmType, typename Derived>
class AlgorithmFactory {
 public:
  using return_type = std::unique_ptr<BaseAlgorithmType>;
  using functor_type = std::function<return_type(void)>;

  /**
   * @brief Create an implementation by name
   * @param name Registered name or alias; empty selects the default
   * @throws std::runtime_error if no implementation is registered under
   * @p name
   */
  static return_type create(const std::string& name = "") {
    const std::string key =
        name.empty() ? Derived::default_algorithm_name() : name;
    auto& reg = registry();
    auto it = reg.find(key);
    if (it == reg.end()) {
      std::string known;
      for (const auto& [k, unused] : reg) {
        known += known.empty() ? k : ", " + k;
      }
      throw std::runtime_error("Algorithm factory for " +
                               Derived::algorithm_type_name() + ": '" + key +
                               "' is not registered. Available: " + known);
    }
    return it->second();
  }

  /**
   * @brief Register an implementation under its name and aliases
   * @throws std::runtime_error if the implementation belongs to another
   * interface or one of its names is taken
   */
  static void register_instance(functor_type func) {
    auto& reg = registry();
    auto probe = func();
    if (probe->type_name() != Derived::algorithm_type_name()) {
      throw std::runtime_error(
          "Algorithm factory for " + Derived::algorithm_type_name() +
          ": cannot register '" + probe->name() + "' of type " +
          probe->type_name());
    }

    const auto aliases = probe->aliases();
    for (const auto& alias : aliases) {
      if (reg.count(alias) != 0) {
        throw std::runtime_error("Algorithm factory for " +
                                 Derived::algorithm_type_name() + ": name '" +
                                 alias + "' is already registered");
      }
    }
    for (const auto& alias : aliases) {
      reg[alias] = func;
    }
  }

  /// Remove one registry entry; false if @p key was not registered
  static bool unregister_instance(const std::string& key) {
    return registry().erase(key) > 0;
  }

  /// Registered names and aliases in lexicographic order
  static std::vector<std::string> available() {
    std::vector<std::string> keys;
    for (const auto& [key, unused] : registry()) {
      keys.push_back(key);
    }
    return keys;
  }

  static bool has(const std::string& key) { return registry().count(key) != 0; }

  /// Remove every entry, the defaults included
  static void clear() { registry().clear(); }

 protected:
  static std::map<std::string, functor_type>& registry() {
    static std::map<std::string, functor_type> instance;
    static bool initialized = false;
    if (!initialized) {
      initialized = true;
      Derived::register_default_instances();
    }
    return instance;
  }
};

}  // namespace diven::algorithms
