#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/default_printer.hpp>
#include <spdlog/spdlog.h>
#include <storage/platform_storage.hpp>

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = devid::cli_utils::parse_cli_args(argc, argv);

  devid::cli_utils::configure_logging(args);

  auto storage = devid::storage::make_platform_storage();
  const devid::core::default_printer printer;

  return devid::cli_utils::execute_cli_command(args, storage, printer);
}
