#include <storage/platform_storage.hpp>

#include <core/device_id_store.hpp>

#ifdef _WIN32
#include <memory>
#endif

namespace devid {

auto storage::make_platform_storage() -> platform_storage_t
{
#ifdef _WIN32
  return platform_storage_t{ std::make_shared<windows_registry>() };
#else
  return platform_storage_t{};
#endif
}

auto get() -> std::optional<core::device_id>
{
  auto backend = storage::make_platform_storage();
  return core::get(backend);
}

auto get_or_generate() -> core::device_id
{
  auto backend = storage::make_platform_storage();
  return core::get_or_generate(backend);
}

}// namespace devid
