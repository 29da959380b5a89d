#pragma once

#include "settings.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <concepts>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace weasel::cli {

enum class action { run, help, version };

struct command {
  action what{action::run};
  settings options{};
};

namespace details {

  enum class option_id {
    phrase,
    charset,
    iterations,
    mutation_rate,
    seed,
    verbose,
    help,
    version
  };

  struct option {
    option_id id;
    std::string_view long_name;
    char short_name;
    bool takes_value;
  };

  inline constexpr std::array options{
      option{option_id::phrase, "phrase", 'p', true},
      option{option_id::charset, "char-set", 'c', true},
      option{option_id::iterations, "iterations", 'i', true},
      option{option_id::mutation_rate, "mutation-rate", 'm', true},
      option{option_id::seed, "seed", 's', true},
      option{option_id::verbose, "verbose", 'v', false},
      option{option_id::help, "help", 'h', false},
      option{option_id::version, "version", 'V', false}};

  inline option const* find_long(std::string_view name) noexcept {
    auto it = std::ranges::find(options, name, &option::long_name);
    return it != options.end() ? &*it : nullptr;
  }

  inline option const* find_short(char name) noexcept {
    auto it = std::ranges::find(options, name, &option::short_name);
    return it != options.end() ? &*it : nullptr;
  }

  template<std::integral Value>
  Value parse_number(option const& opt, std::string_view text) {
    Value result{};

    auto last = text.data() + text.size();
    if (auto [ptr, ec] = std::from_chars(text.data(), last, result);
        ec != std::errc{} || ptr != last) {
      throw configuration_error(fmt::format(
          "Invalid value '{}' for '--{}'", text, opt.long_name));
    }

    return result;
  }

  inline void apply(command& cmd,
                    option const& opt,
                    std::optional<std::string_view> value) {
    auto& target = cmd.options;

    switch (opt.id) {
    case option_id::phrase: target.phrase = *value; break;
    case option_id::charset: target.charset = *value; break;
    case option_id::iterations:
      target.iterations = parse_number<std::int64_t>(opt, *value);
      break;
    case option_id::mutation_rate:
      target.mutation_rate = parse_number<std::int64_t>(opt, *value);
      break;
    case option_id::seed:
      target.seed = parse_number<std::uint64_t>(opt, *value);
      break;
    case option_id::verbose: target.verbose = true; break;
    case option_id::help: cmd.what = action::help; break;
    case option_id::version:
      if (cmd.what != action::help) {
        cmd.what = action::version;
      }
      break;
    }
  }

} // namespace details

inline std::string usage(std::string_view program) {
  return fmt::format(
      "Run the weasel genetic algorithm on a given phrase and approved "
      "character set\n"
      "\n"
      "Usage: {} --phrase <PHRASE> [OPTIONS]\n"
      "\n"
      "Options:\n"
      "  -p, --phrase <PHRASE>          The phrase to run the algorithm on\n"
      "  -c, --char-set <CHAR_SET>      The approved character set "
      "[default: {}]\n"
      "  -i, --iterations <N>           The number of variations to produce "
      "per generation, >= 1 [default: {}]\n"
      "  -m, --mutation-rate <RATE>     The mutation rate for each character, "
      "from {}-{} [default: {}]\n"
      "  -s, --seed <SEED>              Seed for the random number generator\n"
      "  -v, --verbose                  Log run statistics to stderr\n"
      "  -h, --help                     Print help\n"
      "  -V, --version                  Print version\n",
      program,
      default_charset,
      default_iterations,
      min_mutation_rate,
      max_mutation_rate,
      default_mutation_rate);
}

// args excludes the program name
inline command parse(std::span<char const* const> args) {
  command result{};
  auto has_phrase = false;

  for (std::size_t idx = 0; idx < args.size(); ++idx) {
    std::string_view arg{args[idx]};

    details::option const* opt = nullptr;
    std::optional<std::string_view> value{};

    if (arg.starts_with("--")) {
      auto name = arg.substr(2);
      if (auto eq = name.find('='); eq != std::string_view::npos) {
        value = name.substr(eq + 1);
        name = name.substr(0, eq);
      }

      opt = details::find_long(name);
    }
    else if (arg.size() >= 2 && arg.front() == '-') {
      opt = details::find_short(arg[1]);
      if (arg.size() > 2) {
        value = arg.substr(2);
      }
    }

    if (opt == nullptr) {
      throw configuration_error(
          fmt::format("Unexpected argument '{}'", arg));
    }

    if (opt->takes_value && !value) {
      if (idx + 1 >= args.size()) {
        throw configuration_error(fmt::format(
            "A value is required for '--{}'", opt->long_name));
      }

      value = args[++idx];
    }
    else if (!opt->takes_value && value) {
      throw configuration_error(fmt::format(
          "Unexpected value '{}' for '--{}'", *value, opt->long_name));
    }

    has_phrase = has_phrase || opt->id == details::option_id::phrase;
    details::apply(result, *opt, value);
  }

  if (result.what == action::run && !has_phrase) {
    throw configuration_error("The required option '--phrase' was not provided");
  }

  return result;
}

} // namespace weasel::cli
