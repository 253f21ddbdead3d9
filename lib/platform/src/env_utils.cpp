#include <platform/env_utils.hpp>

#include <cstdlib>
#include <mutex>

#ifdef _WIN32
#include <memory>
#endif

namespace devid::platform {

auto get_env_var(const std::string &name) -> std::optional<std::string>
{
#ifdef _WIN32
  char *value_raw = nullptr;
  size_t len = 0;
  if (_dupenv_s(&value_raw, &len, name.c_str()) == 0 and value_raw != nullptr) {
    const std::unique_ptr<char, decltype(&free)> value(value_raw, &free);
    if (*value == '\0') { return std::nullopt; }
    return std::string{ value.get() };
  }
  return std::nullopt;
#else
  static std::mutex env_mutex;
  const std::scoped_lock lock(env_mutex);

  const char *value = std::getenv(name.c_str());// NOLINT(concurrency-mt-unsafe)
  if (value == nullptr or *value == '\0') { return std::nullopt; }
  return std::string{ value };
#endif
}

auto get_home_directory() -> std::optional<std::string>
{
#ifdef _WIN32
  return get_env_var("USERPROFILE");
#else
  return get_env_var("HOME");
#endif
}

auto get_temp_directory() -> std::string
{
#ifdef _WIN32
  return get_env_var("TEMP").value_or("C:\\temp");
#else
  return get_env_var("TMPDIR").value_or("/tmp");
#endif
}

}// namespace devid::platform
