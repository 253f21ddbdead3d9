#pragma once

#include <concepts/registry.hpp>
#include <core/device_id.hpp>
#include <core/errors.hpp>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace devid::storage {

/// Subkey of HKEY_CURRENT_USER holding the record.
inline constexpr auto registry_path = R"(SOFTWARE\Microsoft\DeveloperTools)";

/// Name of the string value holding the identifier.
inline constexpr auto registry_value_name = "deviceid";

/**
 * @brief Device ID persisted as a string value in the per-user registry hive.
 *
 * @tparam Registry Type satisfying concepts::registry
 */
template<concepts::registry Registry> class registry_storage
{
public:
  explicit registry_storage(std::shared_ptr<Registry> registry) : registry_(std::move(registry)) {}

  /**
   * @brief Reads the stored identifier.
   *
   * @return Identifier, or std::nullopt if the key or value does not exist
   * @throws core::storage_error on registry access failure
   * @throws core::bad_format_error if the value is not a UUID
   */
  [[nodiscard]] auto retrieve() const -> std::optional<core::device_id>
  {
    const auto value = registry_->get_hkcu_value(registry_path, registry_value_name);
    if (not value) {
      spdlog::debug("[storage] No device ID value under HKCU\\{}", registry_path);
      return std::nullopt;
    }
    return core::device_id::parse(*value);
  }

  /**
   * @brief Writes the identifier, creating the key if needed.
   *
   * @param id Identifier to persist
   * @throws core::already_set_error if the value already exists
   * @throws core::storage_error on registry access failure
   */
  auto store(const core::device_id &id) const -> void
  {
    if (registry_->get_hkcu_value(registry_path, registry_value_name)) { throw core::already_set_error(); }

    registry_->set_hkcu_value(registry_path, registry_value_name, id.to_string());
    spdlog::debug("[storage] Stored device ID {} under HKCU\\{}", id, registry_path);
  }

private:
  std::shared_ptr<Registry> registry_;
};

}// namespace devid::storage
