#pragma once

#include <cstdio>
#include <fmt/core.h>

namespace devid::core {

/**
 * @brief Console output for the CLI.
 *
 * Device IDs go to stdout so the output can be piped; hints go to stderr.
 */
class default_printer
{
public:
  template<typename... Args> auto print(fmt::format_string<Args...> format_string, Args &&...args) const -> void
  {
    fmt::print(format_string, std::forward<Args>(args)...);
  }

  template<typename... Args> auto print_error(fmt::format_string<Args...> format_string, Args &&...args) const -> void
  {
    fmt::print(stderr, format_string, std::forward<Args>(args)...);
  }
};

}// namespace devid::core
