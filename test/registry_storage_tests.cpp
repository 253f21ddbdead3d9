#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <concepts/storage.hpp>
#include <core/device_id.hpp>
#include <core/device_id_store.hpp>
#include <core/errors.hpp>
#include <memory>
#include <storage/registry_storage.hpp>
#include <storage/windows_registry.hpp>
#include <string>

#include "test_doubles/test_double_registry.hpp"

namespace {

constexpr auto known_id = "550e8400-e29b-41d4-a716-446655440000";

using registry_storage_t = devid::storage::registry_storage<devid_test::TestDoubleRegistry>;

static_assert(devid::concepts::storage<registry_storage_t>);

}// namespace

TEST_CASE("registry_storage retrieve", "[storage][registry]")
{
  SECTION("empty registry has no device ID")
  {
    const registry_storage_t storage(std::make_shared<devid_test::TestDoubleRegistry>());

    REQUIRE_FALSE(storage.retrieve().has_value());
  }

  SECTION("existing key without the value has no device ID")
  {
    auto registry = std::make_shared<devid_test::TestDoubleRegistry>();
    registry->create_key(devid::storage::registry_path);
    const registry_storage_t storage(registry);

    REQUIRE_FALSE(storage.retrieve().has_value());
  }

  SECTION("preinitialized value is returned")
  {
    const registry_storage_t storage(std::make_shared<devid_test::TestDoubleRegistry>(
      devid::storage::registry_path, devid::storage::registry_value_name, known_id));

    const auto id = storage.retrieve();
    REQUIRE(id.has_value());
    REQUIRE(id->to_string() == known_id);
  }

  SECTION("value under another path is ignored")
  {
    const registry_storage_t storage(std::make_shared<devid_test::TestDoubleRegistry>(
      R"(SOFTWARE\Other)", devid::storage::registry_value_name, known_id));

    REQUIRE_FALSE(storage.retrieve().has_value());
  }

  SECTION("corrupted value is a bad format error")
  {
    const registry_storage_t storage(std::make_shared<devid_test::TestDoubleRegistry>(
      devid::storage::registry_path, devid::storage::registry_value_name, "not-a-uuid"));

    REQUIRE_THROWS_AS(storage.retrieve(), devid::core::bad_format_error);
  }
}

TEST_CASE("registry_storage store", "[storage][registry]")
{
  auto registry = std::make_shared<devid_test::TestDoubleRegistry>();
  const registry_storage_t storage(registry);

  SECTION("stored value is read back")
  {
    const auto id = devid::core::device_id::generate();
    storage.store(id);

    REQUIRE(registry->get_hkcu_value(devid::storage::registry_path, devid::storage::registry_value_name)
            == id.to_string());
    REQUIRE(storage.retrieve() == id);
  }

  SECTION("second store is refused and keeps the first value")
  {
    const auto first = devid::core::device_id::generate();
    const auto second = devid::core::device_id::generate();

    storage.store(first);
    REQUIRE_THROWS_AS(storage.store(second), devid::core::already_set_error);
    REQUIRE(storage.retrieve() == first);
    REQUIRE(registry->write_count() == 1);
  }
}

TEST_CASE("registry_storage through the facade", "[storage][registry][facade]")
{
  SECTION("empty registry: get, generate, get again")
  {
    registry_storage_t storage(std::make_shared<devid_test::TestDoubleRegistry>());

    REQUIRE_FALSE(devid::core::get(storage).has_value());

    const auto generated = devid::core::get_or_generate(storage);

    const auto retrieved = devid::core::get(storage);
    REQUIRE(retrieved.has_value());
    REQUIRE(*retrieved == generated);
    REQUIRE(devid::core::get_or_generate(storage) == generated);
  }

  SECTION("preinitialized registry is left unchanged")
  {
    auto registry = std::make_shared<devid_test::TestDoubleRegistry>(
      devid::storage::registry_path, devid::storage::registry_value_name, known_id);
    registry_storage_t storage(registry);

    REQUIRE(devid::core::get_or_generate(storage).to_string() == known_id);
    REQUIRE(devid::core::get(storage)->to_string() == known_id);
    REQUIRE(registry->write_count() == 0);
  }
}

TEST_CASE("read_growing_value retries while the value grows", "[storage][registry]")
{
  SECTION("value that grows after the size query is read in full")
  {
    std::string stored = "short";
    auto reads = 0;

    const auto value = devid::storage::read_growing_value([&](char *buffer, std::size_t &size) {
      const auto required = stored.size() + 1;
      if (buffer == nullptr) {
        size = required;
        stored = known_id;
        return devid::storage::read_status::success;
      }
      ++reads;
      if (size < required) {
        size = required;
        return devid::storage::read_status::more_data;
      }
      std::copy(stored.c_str(), stored.c_str() + required, buffer);
      size = required;
      return devid::storage::read_status::success;
    });

    REQUIRE(value == known_id);
    REQUIRE(reads == 2);
  }

  SECTION("missing value is absent")
  {
    const auto value = devid::storage::read_growing_value(
      [](char * /*buffer*/, std::size_t & /*size*/) { return devid::storage::read_status::not_found; });

    REQUIRE_FALSE(value.has_value());
  }

  SECTION("value removed between queries is absent")
  {
    const auto value = devid::storage::read_growing_value([](char *buffer, std::size_t &size) {
      if (buffer == nullptr) {
        size = 8;
        return devid::storage::read_status::success;
      }
      return devid::storage::read_status::not_found;
    });

    REQUIRE_FALSE(value.has_value());
  }
}
