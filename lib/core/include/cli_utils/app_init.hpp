#pragma once

#include <cli_utils/cli_parser.hpp>
#include <concepts/storage.hpp>
#include <core/device_id_store.hpp>
#include <core/errors.hpp>
#include <spdlog/spdlog.h>

#include "internal_use_only/config.hpp"

namespace devid::cli_utils {

enum exit_code : int { success = 0, storage_failure = 1, bad_format = 2 };

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);
}

[[nodiscard]] inline auto to_exit_code(const core::device_id_error &error) -> int
{
  switch (error.kind()) {
  case core::error_kind::bad_format:
    return exit_code::bad_format;
  case core::error_kind::storage:
  case core::error_kind::already_set:
    break;
  }
  return exit_code::storage_failure;
}

/**
 * @brief Runs the command selected by the parsed arguments.
 *
 * Without flags prints the stored ID, or a hint on how to create one to the
 * error channel; with
 * --generate prints the stored ID, creating it first if needed.
 *
 * @return Process exit code
 */
template<concepts::storage Storage, typename Printer>
[[nodiscard]] auto execute_cli_command(const cli_args &args, Storage &storage, const Printer &printer) -> int
{
  if (args.show_version) {
    printer.print("{} v{}\n", devid::cmake::project_name, devid::cmake::project_version);
    return exit_code::success;
  }

  try {
    if (args.generate) {
      printer.print("Device ID: {}\n", core::get_or_generate(storage));
      return exit_code::success;
    }

    if (const auto id = core::get(storage)) {
      printer.print("Device ID: {}\n", *id);
    } else {
      printer.print_error("No Device ID found, generate a new one with '{} -f'\n", args.program_name);
    }
    return exit_code::success;
  } catch (const core::device_id_error &e) {
    spdlog::error("{}", e.what());
    return to_exit_code(e);
  }
}

}// namespace devid::cli_utils
