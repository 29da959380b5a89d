#pragma once

#include "command_line.hpp"
#include "logging.hpp"
#include "weasel.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <ostream>
#include <span>
#include <string_view>

namespace weasel {

// returns the process exit code; failures are logged to stderr
inline int execute(std::string_view program,
                   std::span<char const* const> args,
                   std::ostream& output) {
  try {
    setup_logging(false);

    auto cmd = cli::parse(args);

    switch (cmd.what) {
    case cli::action::help: output << cli::usage(program); return 0;
    case cli::action::version:
      output << fmt::format("weasel {}\n", WEASEL_VERSION);
      return 0;
    case cli::action::run: break;
    }

    setup_logging(cmd.options.verbose);

    validate(cmd.options);
    run(cmd.options, output);
  }
  catch (error const& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  catch (std::exception const& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}

} // namespace weasel
