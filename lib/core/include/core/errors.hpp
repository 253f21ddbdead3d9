#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace devid::core {

enum class error_kind : std::uint8_t { storage, bad_format, already_set };

/**
 * @brief Base class for all device ID failures.
 */
class device_id_error : public std::runtime_error
{
public:
  device_id_error(error_kind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] auto kind() const noexcept -> error_kind { return kind_; }

private:
  error_kind kind_;
};

/**
 * @brief I/O, permission or registry fault, or an unresolvable storage location.
 */
class storage_error : public device_id_error
{
public:
  explicit storage_error(const std::string &detail)
    : device_id_error(error_kind::storage, "Failed to store or retrieve device ID due to storage error: " + detail)
  {}
};

/**
 * @brief Persisted value is not a valid UUID.
 */
class bad_format_error : public device_id_error
{
public:
  explicit bad_format_error(const std::string &detail)
    : device_id_error(error_kind::bad_format, "Failed to parse device ID, as UUID due to " + detail)
  {}
};

/**
 * @brief A record already exists at the storage location.
 */
class already_set_error : public device_id_error
{
public:
  already_set_error() : device_id_error(error_kind::already_set, "Device ID is already set") {}
};

}// namespace devid::core
