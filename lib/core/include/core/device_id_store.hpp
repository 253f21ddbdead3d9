#pragma once

#include <concepts/storage.hpp>
#include <core/device_id.hpp>
#include <core/errors.hpp>
#include <optional>
#include <spdlog/spdlog.h>

namespace devid::core {

/**
 * @brief Reads the persisted device ID.
 *
 * @tparam Storage Type satisfying concepts::storage
 * @param storage Backend to read from
 * @return Stored identifier, or std::nullopt if none exists yet
 * @throws storage_error on I/O or registry faults
 * @throws bad_format_error if the stored value is not a UUID
 */
template<concepts::storage Storage> [[nodiscard]] auto get(Storage &storage) -> std::optional<device_id>
{
  return storage.retrieve();
}

/**
 * @brief Reads the persisted device ID, creating and storing one if absent.
 *
 * After attempting to store a fresh identifier the record is read back, so a
 * concurrent writer that won the race determines the returned value. The
 * fresh identifier is only returned when the read-back finds nothing.
 *
 * @tparam Storage Type satisfying concepts::storage
 * @param storage Backend to read from and write to
 * @return The identifier now persisted
 * @throws storage_error on I/O or registry faults
 * @throws bad_format_error if the stored value is not a UUID
 */
template<concepts::storage Storage> [[nodiscard]] auto get_or_generate(Storage &storage) -> device_id
{
  if (auto existing = storage.retrieve()) { return *existing; }

  const auto fresh = device_id::generate();
  spdlog::debug("[device_id] No device ID stored, generated {}", fresh);

  try {
    storage.store(fresh);
  } catch (const already_set_error &) {
    spdlog::debug("[device_id] Device ID was stored concurrently, reading it back");
  }

  return storage.retrieve().value_or(fresh);
}

}// namespace devid::core
