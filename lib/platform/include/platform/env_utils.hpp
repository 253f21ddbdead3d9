#pragma once

#include <optional>
#include <string>

namespace devid::platform {

/**
 * @brief Reads an environment variable.
 *
 * @param name Variable name
 * @return Value, or std::nullopt if the variable is unset or empty
 */
[[nodiscard]] auto get_env_var(const std::string &name) -> std::optional<std::string>;

/**
 * @brief Returns the user's home directory path.
 *
 * @return Home directory, or std::nullopt if it cannot be determined
 */
[[nodiscard]] auto get_home_directory() -> std::optional<std::string>;

/**
 * @brief Returns the system's temporary directory path.
 *
 * @return Temporary directory path
 */
[[nodiscard]] auto get_temp_directory() -> std::string;

}// namespace devid::platform
