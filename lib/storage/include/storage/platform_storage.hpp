#pragma once

#include <core/device_id.hpp>
#include <optional>

#ifdef _WIN32
#include <storage/registry_storage.hpp>
#include <storage/windows_registry.hpp>
#else
#include <storage/file_storage.hpp>
#endif

namespace devid {

namespace storage {

#ifdef _WIN32
  using platform_storage_t = registry_storage<windows_registry>;
#else
  using platform_storage_t = file_storage;
#endif

  /**
   * @brief Creates the storage backend for the host operating system.
   */
  [[nodiscard]] auto make_platform_storage() -> platform_storage_t;

}// namespace storage

/**
 * @brief Reads the device ID for the current user.
 *
 * @return Stored identifier, or std::nullopt if none exists yet
 * @throws core::storage_error on I/O or registry faults
 * @throws core::bad_format_error if the stored value is not a UUID
 */
[[nodiscard]] auto get() -> std::optional<core::device_id>;

/**
 * @brief Reads the device ID for the current user, generating and storing one if absent.
 *
 * If this returns normally, the returned identifier is the one persisted
 * (or the freshly generated one if it could not be read back).
 *
 * @throws core::storage_error on I/O or registry faults
 * @throws core::bad_format_error if the stored value is not a UUID
 */
[[nodiscard]] auto get_or_generate() -> core::device_id;

}// namespace devid
