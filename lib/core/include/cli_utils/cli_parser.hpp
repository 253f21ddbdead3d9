#pragma once

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace devid::cli_utils {

struct cli_args
{
  std::string program_name = "devid";
  bool generate = false;
  bool verbose = false;
  bool show_version = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_flag("-f,--generate", args.generate, "Generate a new Device ID, if one is not already set");
  app.add_flag("-v,--version", args.show_version, "Show version information");
  app.add_flag("--verbose", args.verbose, "Enable verbose logging");
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (argc > 0 and argv[0] != nullptr) { args.program_name = std::filesystem::path(argv[0]).filename().string(); }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  CLI::App app{ "Retrieve or generate the device ID for this user", args.program_name };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    std::exit(app.exit(e));// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

}// namespace devid::cli_utils
