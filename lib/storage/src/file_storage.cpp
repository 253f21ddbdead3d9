#include <storage/file_storage.hpp>

#include <core/errors.hpp>
#include <fmt/format.h>
#include <fstream>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>

namespace devid::storage {

namespace {

  auto trim_trailing_whitespace(std::string &text) -> void
  {
    const auto end = text.find_last_not_of(" \t\r\n");
    text.erase(end == std::string::npos ? 0 : end + 1);
  }

  auto record_exists(const std::filesystem::path &path) -> bool
  {
    std::error_code error;
    const auto found = std::filesystem::exists(path, error);
    if (error) {
      throw core::storage_error(fmt::format("cannot access {}: {}", path.string(), error.message()));
    }
    return found;
  }

}// namespace

auto resolve_root_path() -> std::filesystem::path
{
#if defined(__APPLE__)
  const auto home = platform::get_home_directory();
  if (not home) { throw core::storage_error("HOME environment variable not set"); }
  return std::filesystem::path(*home) / "Library" / "Application Support";
#else
  if (const auto cache_home = platform::get_env_var("XDG_CACHE_HOME")) { return std::filesystem::path(*cache_home); }

  const auto home = platform::get_home_directory();
  if (not home) { throw core::storage_error("XDG_CACHE_HOME and HOME environment variables not set"); }
  return std::filesystem::path(*home) / ".cache";
#endif
}

auto resolve_record_path() -> std::filesystem::path
{
  return resolve_root_path() / record_subdirectory / record_filename;
}

auto file_storage::record_path() const -> std::filesystem::path
{
  return record_path_ ? *record_path_ : resolve_record_path();
}

auto file_storage::retrieve() const -> std::optional<core::device_id>
{
  const auto path = record_path();
  spdlog::trace("[storage] Reading device ID from {}", path.string());

  if (not record_exists(path)) {
    spdlog::debug("[storage] No device ID record at {}", path.string());
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (not file) { throw core::storage_error(fmt::format("cannot open {} for reading", path.string())); }

  std::string content(max_record_size + 1, '\0');
  file.read(content.data(), static_cast<std::streamsize>(content.size()));
  if (file.bad()) { throw core::storage_error(fmt::format("failed to read {}", path.string())); }
  content.resize(static_cast<std::size_t>(file.gcount()));

  if (content.size() > max_record_size) {
    throw core::bad_format_error(fmt::format("record exceeds {} bytes", max_record_size));
  }

  trim_trailing_whitespace(content);
  auto id = core::device_id::parse(content);
  spdlog::debug("[storage] Read device ID {} from {}", id, path.string());
  return id;
}

auto file_storage::store(const core::device_id &id) const -> void
{
  const auto path = record_path();

  std::error_code error;
  std::filesystem::create_directories(path.parent_path(), error);
  if (error) {
    throw core::storage_error(
      fmt::format("cannot create directory {}: {}", path.parent_path().string(), error.message()));
  }

  if (record_exists(path)) { throw core::already_set_error(); }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (not file) { throw core::storage_error(fmt::format("cannot open {} for writing", path.string())); }

  const auto text = id.to_string();
  file.write(text.data(), static_cast<std::streamsize>(text.size()));
  file.close();
  if (not file) { throw core::storage_error(fmt::format("failed to write {}", path.string())); }

  spdlog::debug("[storage] Stored device ID {} at {}", id, path.string());
}

}// namespace devid::storage
