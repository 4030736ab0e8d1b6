#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/default_printer.hpp>
#include <spdlog/spdlog.h>
#include <supplier/default_supplier.hpp>

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = uuid_kit::cli_utils::parse_cli_args(argc, argv);

  uuid_kit::cli_utils::configure_logging(args);

  if (not uuid_kit::cli_utils::validate_cli_args(args)) { return 1; }

  const uuid_kit::core::default_printer printer;
  return uuid_kit::cli_utils::execute_cli_command(args, uuid_kit::supplier::get_default, printer);
}
