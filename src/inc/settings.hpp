#pragma once

#include "error.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace weasel {

inline constexpr std::string_view default_charset =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ abcdefghijklmnopqrstuvwxyz!?.";

inline constexpr std::int64_t default_iterations = 100;
inline constexpr std::int64_t default_mutation_rate = 5;

inline constexpr std::int64_t min_mutation_rate = 1;
inline constexpr std::int64_t max_mutation_rate = 100;

struct settings {
  std::string phrase;
  std::string charset{default_charset};
  std::int64_t iterations{default_iterations};
  std::int64_t mutation_rate{default_mutation_rate};
  std::optional<std::uint64_t> seed;
  bool verbose{false};
};

inline void validate(settings const& value) {
  if (value.mutation_rate < min_mutation_rate ||
      value.mutation_rate > max_mutation_rate) {
    throw configuration_error(
        fmt::format("Mutation value should be within [{}-{}], not {}",
                    min_mutation_rate,
                    max_mutation_rate,
                    value.mutation_rate));
  }

  if (value.iterations < 1) {
    throw configuration_error(fmt::format(
        "Iterations value should be >= 1, not {}", value.iterations));
  }

  if (value.phrase.empty()) {
    throw configuration_error("Phrase should not be empty");
  }
}

} // namespace weasel
