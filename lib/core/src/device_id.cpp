#include <core/device_id.hpp>
#include <core/errors.hpp>

#include <array>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_hash.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

namespace devid::core {

namespace {

  constexpr std::array<std::size_t, 4> hyphen_offsets{ 8, 13, 18, 23 };

  auto is_hyphen_offset(std::size_t offset) -> bool
  {
    for (const auto hyphen : hyphen_offsets) {
      if (hyphen == offset) { return true; }
    }
    return false;
  }

  auto validate_canonical(std::string_view text) -> void
  {
    if (text.size() != device_id::text_length) {
      throw bad_format_error(
        fmt::format("invalid length: expected {} characters, found {}", device_id::text_length, text.size()));
    }

    for (std::size_t offset = 0; offset < text.size(); ++offset) {
      const auto character = static_cast<unsigned char>(text[offset]);
      if (is_hyphen_offset(offset)) {
        if (character != '-') { throw bad_format_error(fmt::format("expected '-' at position {}", offset)); }
      } else if (std::isxdigit(character) == 0) {
        throw bad_format_error(fmt::format("invalid character at position {}", offset));
      }
    }
  }

}// namespace

auto device_id::generate() -> device_id
{
  static thread_local boost::uuids::random_generator gen;
  return device_id{ gen() };
}

auto device_id::parse(std::string_view text) -> device_id
{
  validate_canonical(text);

  try {
    boost::uuids::string_generator parser;
    return device_id{ parser(text.begin(), text.end()) };
  } catch (const std::runtime_error &e) {
    throw bad_format_error(e.what());
  }
}

auto device_id::to_string() const -> std::string { return boost::uuids::to_string(uuid_); }

auto device_id::operator<=>(const device_id &other) const -> std::strong_ordering
{
  if (uuid_ < other.uuid_) { return std::strong_ordering::less; }
  if (other.uuid_ < uuid_) { return std::strong_ordering::greater; }
  return std::strong_ordering::equal;
}

}// namespace devid::core

auto std::hash<devid::core::device_id>::operator()(const devid::core::device_id &id) const noexcept -> std::size_t
{
  return boost::uuids::hash_value(id.uuid());
}
