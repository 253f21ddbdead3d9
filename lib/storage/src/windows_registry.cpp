#include <storage/windows_registry.hpp>

#include <core/errors.hpp>
#include <fmt/format.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace devid::storage {

namespace {

  using key_handle = std::unique_ptr<std::remove_pointer_t<HKEY>, decltype(&RegCloseKey)>;

  auto describe(LSTATUS status) -> std::string
  {
    return std::system_category().message(static_cast<int>(status));
  }

}// namespace

auto windows_registry::get_hkcu_value(const std::string &path, const std::string &name) const
  -> std::optional<std::string>
{
  HKEY raw_key = nullptr;
  auto status = RegOpenKeyExA(HKEY_CURRENT_USER, path.c_str(), 0, KEY_READ | KEY_WOW64_64KEY, &raw_key);
  if (status == ERROR_FILE_NOT_FOUND) { return std::nullopt; }
  if (status != ERROR_SUCCESS) {
    throw core::storage_error(fmt::format("cannot open HKCU\\{}: {}", path, describe(status)));
  }
  const key_handle key(raw_key, &RegCloseKey);

  return read_growing_value([&](char *buffer, std::size_t &size) {
    auto size_in_bytes = static_cast<DWORD>(size);
    const auto read =
      RegGetValueA(key.get(), nullptr, name.c_str(), RRF_RT_REG_SZ, nullptr, buffer, &size_in_bytes);
    size = size_in_bytes;
    if (read == ERROR_SUCCESS) { return read_status::success; }
    if (read == ERROR_FILE_NOT_FOUND) { return read_status::not_found; }
    if (read == ERROR_MORE_DATA) { return read_status::more_data; }
    throw core::storage_error(fmt::format("cannot read HKCU\\{}\\{}: {}", path, name, describe(read)));
  });
}

auto windows_registry::set_hkcu_value(const std::string &path, const std::string &name, const std::string &value) const
  -> void
{
  HKEY raw_key = nullptr;
  auto status = RegCreateKeyExA(HKEY_CURRENT_USER,
    path.c_str(),
    0,
    nullptr,
    REG_OPTION_NON_VOLATILE,
    KEY_ALL_ACCESS | KEY_WOW64_64KEY,
    nullptr,
    &raw_key,
    nullptr);
  if (status != ERROR_SUCCESS) {
    throw core::storage_error(fmt::format("cannot create HKCU\\{}: {}", path, describe(status)));
  }
  const key_handle key(raw_key, &RegCloseKey);

  status = RegSetValueExA(key.get(),
    name.c_str(),
    0,
    REG_SZ,
    reinterpret_cast<const BYTE *>(value.c_str()),// NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    static_cast<DWORD>(value.size() + 1));
  if (status != ERROR_SUCCESS) {
    throw core::storage_error(fmt::format("cannot write HKCU\\{}\\{}: {}", path, name, describe(status)));
  }
}

}// namespace devid::storage
