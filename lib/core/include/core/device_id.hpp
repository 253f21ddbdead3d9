#pragma once

#include <boost/uuid/uuid.hpp>
#include <compare>
#include <cstddef>
#include <fmt/format.h>
#include <functional>
#include <string>
#include <string_view>

namespace devid::core {

/**
 * @brief Stable identifier for a device/user profile.
 *
 * Immutable value wrapping a 128-bit UUID. Instances are only created by
 * generating a fresh version 4 UUID or by parsing stored text.
 */
class device_id
{
public:
  /// Length of the canonical hyphenated text form.
  static constexpr std::size_t text_length = 36;

  /**
   * @brief Generates a new random (version 4) identifier.
   *
   * @return Freshly generated identifier
   */
  [[nodiscard]] static auto generate() -> device_id;

  /**
   * @brief Parses the canonical hyphenated form (8-4-4-4-12 hex digits).
   *
   * Hex digits may be upper or lower case. Braced, urn-prefixed and
   * unhyphenated forms are rejected.
   *
   * @param text UUID text
   * @return Parsed identifier
   * @throws bad_format_error if text is not a canonical UUID
   */
  [[nodiscard]] static auto parse(std::string_view text) -> device_id;

  /**
   * @brief Renders the canonical lowercase hyphenated form.
   */
  [[nodiscard]] auto to_string() const -> std::string;

  [[nodiscard]] auto uuid() const -> const boost::uuids::uuid & { return uuid_; }

  auto operator==(const device_id &other) const -> bool = default;
  auto operator<=>(const device_id &other) const -> std::strong_ordering;

private:
  explicit device_id(const boost::uuids::uuid &value) : uuid_(value) {}

  boost::uuids::uuid uuid_;
};

}// namespace devid::core

template<> struct std::hash<devid::core::device_id>
{
  auto operator()(const devid::core::device_id &id) const noexcept -> std::size_t;
};

template<> struct fmt::formatter<devid::core::device_id> : fmt::formatter<std::string_view>
{
  template<typename FormatContext> auto format(const devid::core::device_id &id, FormatContext &ctx) const
  {
    return fmt::formatter<std::string_view>::format(id.to_string(), ctx);
  }
};
