#pragma once

#include <concepts>
#include <optional>
#include <string>

namespace devid::concepts {

/**
 * @brief Concept for string values stored under the per-user registry hive.
 *
 * Paths are subkeys of HKEY_CURRENT_USER. get_hkcu_value() returns
 * std::nullopt when either the key or the value does not exist.
 * set_hkcu_value() creates the key if needed.
 */
template<typename T>
concept registry = requires(T registry, const std::string &path, const std::string &name, const std::string &value) {
  { registry.get_hkcu_value(path, name) } -> std::same_as<std::optional<std::string>>;
  { registry.set_hkcu_value(path, name, value) } -> std::same_as<void>;
};

}// namespace devid::concepts
