#pragma once

#include <cli_utils/cli_parser.hpp>
#include <cstddef>
#include <codec/uuids.hpp>
#include <core/errors.hpp>
#include <functional>
#include <internal_use_only/config.hpp>
#include <memory>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <supplier/uuid_supplier.hpp>

namespace uuid_kit::cli_utils {

/**
 * @brief Sends log output to stderr, keeping stdout for UUIDs, then applies
 * SPDLOG_LEVEL from the environment and --verbose on top.
 */
inline auto configure_logging(const cli_args &args) -> void
{
  auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("uuid_kit", stderr_sink);
  spdlog::set_default_logger(logger);

  spdlog::cfg::load_env_levels();

  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

template<typename Printer>
inline auto run_generate(const cli_args &args, const supplier::uuid_supplier &uuid_supplier, Printer &printer) -> void
{
  spdlog::debug("Generating {} UUID(s) with {}", args.generate_count, uuid_supplier.describe());

  for (std::size_t i = 0; i < args.generate_count; ++i) {
    const auto uuid = uuid_supplier.get();
    printer.print("{}\n",
      args.generate_shortened ? codec::to_shortened_representation(uuid) : codec::to_standard_representation(uuid));
  }
}

/**
 * @brief Prints the other representation of args.convert_input.
 *
 * A 36-character input is read as the standard form, anything else as the
 * shortened form.
 *
 * @return false if the input is not a valid UUID in the form it was read as
 */
template<typename Printer> [[nodiscard]] inline auto run_convert(const cli_args &args, Printer &printer) -> bool
{
  try {
    if (args.convert_input.size() == codec::standard_length) {
      const auto uuid = codec::from_standard_representation(args.convert_input);
      printer.print("{}\n", codec::to_shortened_representation(uuid));
    } else {
      const auto uuid = codec::from_shortened_representation(args.convert_input);
      printer.print("{}\n", codec::to_standard_representation(uuid));
    }
  } catch (const core::invalid_format_error &e) {
    spdlog::error("{}", e.what());
    return false;
  }
  return true;
}

/**
 * @brief Yields the supplier generate draws from; only called when generating.
 */
using supplier_provider = std::function<supplier::uuid_supplier_ptr()>;

/**
 * @brief Runs the parsed command.
 *
 * @return Process exit code
 */
template<typename Printer>
[[nodiscard]] inline auto execute_cli_command(const cli_args &args, const supplier_provider &get_supplier, Printer &printer)
  -> int
{
  if (args.show_version) {
    printer.print("uuid-kit v{}\n", uuid_kit::cmake::project_version);
    return 0;
  }

  if (args.convert_parsed) { return run_convert(args, printer) ? 0 : 1; }

  run_generate(args, *get_supplier(), printer);
  return 0;
}

}// namespace uuid_kit::cli_utils
