#pragma once

#include <core/device_id.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief JSON mapping for device_id.
 *
 * The identifier serializes transparently as its canonical string. Since
 * device_id has no default constructor the specialization returns by value.
 */
template<> struct nlohmann::adl_serializer<devid::core::device_id>
{
  static auto to_json(json &j, const devid::core::device_id &id) -> void { j = id.to_string(); }

  static auto from_json(const json &j) -> devid::core::device_id
  {
    if (not j.is_string()) {
      throw devid::core::bad_format_error("expected a JSON string, found " + std::string(j.type_name()));
    }
    return devid::core::device_id::parse(j.get_ref<const std::string &>());
  }
};
