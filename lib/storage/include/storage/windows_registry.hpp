#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace devid::storage {

enum class read_status : std::uint8_t { success, not_found, more_data };

/**
 * @brief Reads a string value whose size may change between the size query and the read.
 *
 * @p query is called with a null buffer to learn the size (in bytes, including
 * the terminating null), then with a buffer of that size. The read is retried
 * while the value keeps growing. Other failures are reported by @p query
 * throwing.
 *
 * @tparam Query Callable as read_status(char *buffer, std::size_t &size)
 * @return Value without the terminating null, or std::nullopt if not found
 */
template<typename Query> [[nodiscard]] auto read_growing_value(Query query) -> std::optional<std::string>
{
  std::size_t size = 0;
  auto status = query(nullptr, size);
  if (status == read_status::not_found) { return std::nullopt; }

  std::string value;
  do {
    value.resize(size);
    status = query(value.data(), size);
    if (status == read_status::not_found) { return std::nullopt; }
  } while (status == read_status::more_data);

  // size includes the terminating null
  value.resize(size > 0 ? size - 1 : 0);
  return value;
}

/**
 * @brief Access to HKEY_CURRENT_USER through the Win32 registry API.
 *
 * All access targets the 64-bit registry view (KEY_WOW64_64KEY) so 32-bit
 * processes are not redirected to WOW6432Node.
 */
class windows_registry
{
public:
  /**
   * @brief Reads a REG_SZ value.
   *
   * @param path Subkey of HKEY_CURRENT_USER
   * @param name Value name
   * @return Value, or std::nullopt if the key or value does not exist
   * @throws core::storage_error on any other failure, including a non-string value type
   */
  [[nodiscard]] auto get_hkcu_value(const std::string &path, const std::string &name) const
    -> std::optional<std::string>;

  /**
   * @brief Writes a REG_SZ value, creating the key if needed.
   *
   * @throws core::storage_error on failure
   */
  auto set_hkcu_value(const std::string &path, const std::string &name, const std::string &value) const -> void;
};

}// namespace devid::storage
