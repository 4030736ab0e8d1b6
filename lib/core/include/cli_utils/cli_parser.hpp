#pragma once

#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string>

namespace uuid_kit::cli_utils {

struct cli_args
{
  bool verbose = false;
  bool show_version = false;

  bool generate_parsed = false;
  std::size_t generate_count = 1;
  bool generate_shortened = false;

  bool convert_parsed = false;
  std::string convert_input;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "uuid-kit - UUID generation and conversion", "uuid-kit" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");

  auto *generate_cmd = app.add_subcommand("generate", "Generate UUIDs with the default supplier");
  generate_cmd->add_option("-n,--count", args.generate_count, "Number of UUIDs to generate");
  generate_cmd->add_flag("-s,--shortened", args.generate_shortened, "Print the 32-digit form without dashes");
  generate_cmd->callback([&args]() { args.generate_parsed = true; });

  auto *convert_cmd = app.add_subcommand("convert", "Convert between the standard and shortened forms");
  convert_cmd->add_option("uuid", args.convert_input, "UUID in either form")->required();
  convert_cmd->callback([&args]() { args.convert_parsed = true; });
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.generate_parsed and args.generate_count == 0) {
    spdlog::error("Generate command requires a count of at least 1");
    return false;
  }

  if (args.convert_parsed and args.convert_input.empty()) {
    spdlog::error("Convert command requires a UUID");
    return false;
  }

  return true;
}

}// namespace uuid_kit::cli_utils
