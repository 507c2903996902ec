// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace tbscc::algorithms {

/**
 * @class Factory
 * @brief Name based registry of algorithm implementations
 *
 * Implementations are registered with a creator function; the key is the
 * name() of the instance the creator returns. The first access to the
 * registry calls Derived::register_default_instances().
 *
 * Derived must provide
 * - `static std::string algorithm_type_name()`
 * - `static std::string default_algorithm_name()`
 * - `static void register_default_instances()`
 *
 * @tparam Base Abstract algorithm interface with a `name()` method
 * @tparam Derived The concrete factory (CRTP)
 */
template <typename Base, typename Derived>
class Factory {
 public:
  using return_type = std::unique_ptr<Base>;
  using creator_type = std::function<return_type()>;

  /**
   * @brief Create a registered implementation
   * @param name Registered name; empty selects the default implementation
   * @throws std::runtime_error if no implementation has that name
   */
  static return_type create(const std::string& name = "") {
    _ensure_defaults();
    const std::string key = name.empty() ? Derived::default_algorithm_name()
                                         : name;
    auto it = _registry().find(key);
    if (it == _registry().end()) {
      throw std::runtime_error("Unknown " + Derived::algorithm_type_name() +
                               " '" + key + "'");
    }
    return it->second();
  }

  /// Registered names in lexicographic order
  static std::vector<std::string> available() {
    _ensure_defaults();
    std::vector<std::string> names;
    for (const auto& [key, _] : _registry()) {
      names.push_back(key);
    }
    return names;
  }

  static bool has(const std::string& name) {
    _ensure_defaults();
    return _registry().count(name) > 0;
  }

  /**
   * @brief Register an implementation under the name of its instances
   * @throws std::runtime_error if the name is already taken
   */
  static void register_instance(creator_type creator) {
    _ensure_defaults();
    auto probe = creator();
    if (!probe) {
      throw std::runtime_error("Creator for " + Derived::algorithm_type_name() +
                               " returned no instance");
    }
    const std::string key = probe->name();
    if (_registry().count(key)) {
      throw std::runtime_error(Derived::algorithm_type_name() + " '" + key +
                               "' is already registered");
    }
    _registry().emplace(key, std::move(creator));
  }

  /// Remove an implementation; false if the name was not registered
  static bool unregister_instance(const std::string& name) {
    _ensure_defaults();
    return _registry().erase(name) > 0;
  }

 private:
  static std::map<std::string, creator_type>& _registry() {
    static std::map<std::string, creator_type> registry;
    return registry;
  }

  static void _ensure_defaults() {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;
    Derived::register_default_instances();
  }
};

}  // namespace tbscc::algorithms
