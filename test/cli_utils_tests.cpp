#include <catch2/catch_test_macros.hpp>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/device_id.hpp>
#include <string>
#include <vector>

#include "internal_use_only/config.hpp"
#include "test_doubles/test_double_printer.hpp"
#include "test_doubles/test_double_storage.hpp"

namespace {

auto create_argv(std::vector<std::string> &args) -> std::vector<char *>
{
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) { argv.push_back(arg.data()); }
  return argv;
}

auto parse(std::vector<std::string> args) -> devid::cli_utils::cli_args
{
  auto argv = create_argv(args);
  return devid::cli_utils::parse_cli_args(static_cast<int>(args.size()), argv.data());
}

}// namespace

TEST_CASE("cli_args default values", "[cli_utils][cli_parser]")
{
  const devid::cli_utils::cli_args args;

  REQUIRE(args.program_name == "devid");
  REQUIRE(args.generate == false);
  REQUIRE(args.verbose == false);
  REQUIRE(args.show_version == false);
}

TEST_CASE("CLI parsing flags", "[cli_utils][cli_parser]")
{
  SECTION("no arguments selects the get command")
  {
    const auto parsed = parse({ "/usr/local/bin/devid" });

    REQUIRE(parsed.program_name == "devid");
    REQUIRE_FALSE(parsed.generate);
    REQUIRE_FALSE(parsed.show_version);
  }

  SECTION("short generate flag") { REQUIRE(parse({ "devid", "-f" }).generate); }

  SECTION("long generate flag") { REQUIRE(parse({ "devid", "--generate" }).generate); }

  SECTION("version flags")
  {
    REQUIRE(parse({ "devid", "-v" }).show_version);
    REQUIRE(parse({ "devid", "--version" }).show_version);
  }

  SECTION("verbose flag") { REQUIRE(parse({ "devid", "--verbose" }).verbose); }
}

TEST_CASE("execute_cli_command", "[cli_utils][app_init]")
{
  devid_test::TestDoubleStorage storage;
  const devid_test::TestDoublePrinter printer;
  devid::cli_utils::cli_args args;
  args.program_name = "devid-test";

  SECTION("get without a stored ID prints a hint to the error channel only")
  {
    REQUIRE(devid::cli_utils::execute_cli_command(args, storage, printer) == devid::cli_utils::exit_code::success);
    REQUIRE(printer.get_error_output() == "No Device ID found, generate a new one with 'devid-test -f'\n");
    REQUIRE(printer.get_output().empty());
    REQUIRE(storage.store_calls == 0);
  }

  SECTION("get prints the stored ID")
  {
    storage.record = devid::core::device_id::parse("550e8400-e29b-41d4-a716-446655440000");

    REQUIRE(devid::cli_utils::execute_cli_command(args, storage, printer) == devid::cli_utils::exit_code::success);
    REQUIRE(printer.get_output() == "Device ID: 550e8400-e29b-41d4-a716-446655440000\n");
    REQUIRE(printer.get_error_output().empty());
  }

  SECTION("generate stores and prints a new ID")
  {
    args.generate = true;

    REQUIRE(devid::cli_utils::execute_cli_command(args, storage, printer) == devid::cli_utils::exit_code::success);
    REQUIRE(storage.record.has_value());
    REQUIRE(printer.get_output() == "Device ID: " + storage.record->to_string() + "\n");
  }

  SECTION("version prints the project version")
  {
    args.show_version = true;

    REQUIRE(devid::cli_utils::execute_cli_command(args, storage, printer) == devid::cli_utils::exit_code::success);
    REQUIRE(printer.get_output()
            == std::string(devid::cmake::project_name) + " v" + std::string(devid::cmake::project_version) + "\n");
  }

  SECTION("storage failure maps to its exit code")
  {
    args.generate = true;
    storage.store_failure = "read-only file system";

    REQUIRE(
      devid::cli_utils::execute_cli_command(args, storage, printer) == devid::cli_utils::exit_code::storage_failure);
    REQUIRE(printer.get_output().empty());
  }

  SECTION("corrupted record maps to its exit code")
  {
    storage.corrupt_record = "not-a-uuid";

    REQUIRE(devid::cli_utils::execute_cli_command(args, storage, printer) == devid::cli_utils::exit_code::bad_format);
  }
}

TEST_CASE("to_exit_code distinguishes error kinds", "[cli_utils][app_init]")
{
  REQUIRE(
    devid::cli_utils::to_exit_code(devid::core::storage_error("x")) == devid::cli_utils::exit_code::storage_failure);
  REQUIRE(
    devid::cli_utils::to_exit_code(devid::core::bad_format_error("x")) == devid::cli_utils::exit_code::bad_format);
  REQUIRE(
    devid::cli_utils::to_exit_code(devid::core::already_set_error()) == devid::cli_utils::exit_code::storage_failure);
}
