#pragma once

#include <concepts>
#include <core/device_id.hpp>
#include <optional>

namespace devid::concepts {

/**
 * @brief Concept defining the persistence capability for a device ID.
 *
 * retrieve() returns std::nullopt when no record exists. store() must refuse
 * to overwrite an existing record by throwing core::already_set_error.
 */
template<typename T>
concept storage = requires(T storage, const core::device_id &id) {
  { storage.retrieve() } -> std::same_as<std::optional<core::device_id>>;
  { storage.store(id) } -> std::same_as<void>;
};

}// namespace devid::concepts
