#pragma once

#include <core/device_id.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <utility>

namespace devid::storage {

/// Vendor/tool subdirectory below the cache root.
inline constexpr auto record_subdirectory = "Microsoft/DeveloperTools";

/// Name of the file holding the identifier.
inline constexpr auto record_filename = "deviceid";

/// Records larger than this are rejected without being read.
inline constexpr std::size_t max_record_size = 1024;

/**
 * @brief Resolves the directory that holds per-user cache data.
 *
 * Linux-family: $XDG_CACHE_HOME, else $HOME/.cache.
 * Apple-family: $HOME/Library/Application Support.
 *
 * @throws core::storage_error if the required variables are unset
 */
[[nodiscard]] auto resolve_root_path() -> std::filesystem::path;

/**
 * @brief Resolves the full path of the device ID record.
 *
 * @throws core::storage_error if the root path cannot be resolved
 */
[[nodiscard]] auto resolve_record_path() -> std::filesystem::path;

/**
 * @brief Device ID persisted as a single text file.
 *
 * The file holds exactly the canonical hyphenated UUID. Trailing whitespace is
 * tolerated on read; none is written.
 */
class file_storage
{
public:
  /**
   * @brief Constructs a store whose location is resolved from the environment on every call.
   */
  file_storage() = default;

  /**
   * @brief Constructs a store bound to a fixed record path.
   *
   * @param record_path Full path of the record file
   */
  explicit file_storage(std::filesystem::path record_path) : record_path_(std::move(record_path)) {}

  /**
   * @brief Reads the stored identifier.
   *
   * @return Identifier, or std::nullopt if the record file does not exist
   * @throws core::storage_error on I/O failure
   * @throws core::bad_format_error if the content is not a UUID
   */
  [[nodiscard]] auto retrieve() const -> std::optional<core::device_id>;

  /**
   * @brief Creates the record, including parent directories.
   *
   * @param id Identifier to persist
   * @throws core::already_set_error if the record file already exists
   * @throws core::storage_error on I/O failure
   */
  auto store(const core::device_id &id) const -> void;

  /**
   * @brief Returns the record path this store currently targets.
   */
  [[nodiscard]] auto record_path() const -> std::filesystem::path;

private:
  std::optional<std::filesystem::path> record_path_;
};

}// namespace devid::storage
