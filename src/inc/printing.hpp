#pragma once

#include "statistics.hpp"

#include <fmt/format.h>

#include <ostream>

namespace weasel {

class print_start {
public:
  inline explicit print_start(std::ostream& output) noexcept
      : output_{&output} {
  }

  inline void operator()(candidate const& best) const {
    *output_ << fmt::format("Start: {}\n", best.chromosome()) << std::flush;
  }

private:
  std::ostream* output_;
};

class print_generation {
public:
  inline explicit print_generation(std::ostream& output) noexcept
      : output_{&output} {
  }

  inline void operator()(candidate const& best,
                         stats::history const& history) const {
    *output_ << fmt::format(
                    "Gen {}: {}\n", history.current().number(), best.chromosome())
             << std::flush;
  }

private:
  std::ostream* output_;
};

} // namespace weasel
