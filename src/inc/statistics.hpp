#pragma once

#include "individual.hpp"

#include <chrono>
#include <cstddef>

namespace weasel::stats {

class generation {
public:
  using clock_t = std::chrono::steady_clock;
  using duration_t = clock_t::duration;

public:
  generation() = default;

  inline generation(std::size_t number,
                    fitness_t best,
                    bool improved,
                    std::size_t evaluations,
                    duration_t elapsed) noexcept
      : number_{number}
      , best_{best}
      , improved_{improved}
      , evaluations_{evaluations}
      , elapsed_{elapsed} {
  }

  inline auto number() const noexcept {
    return number_;
  }

  inline auto best_fitness() const noexcept {
    return best_;
  }

  inline auto improved() const noexcept {
    return improved_;
  }

  inline auto evaluations() const noexcept {
    return evaluations_;
  }

  inline auto elapsed() const noexcept {
    return elapsed_;
  }

private:
  std::size_t number_{};
  fitness_t best_{};
  bool improved_{};
  std::size_t evaluations_{};
  duration_t elapsed_{};
};

class history {
public:
  history() = default;

  inline auto const& next(generation const& value) {
    ++recorded_;
    total_evaluations_ += value.evaluations();
    return current_ = value;
  }

  inline auto const& current() const noexcept {
    return current_;
  }

  inline auto recorded() const noexcept {
    return recorded_;
  }

  inline auto total_evaluations() const noexcept {
    return total_evaluations_;
  }

private:
  generation current_{};
  std::size_t recorded_{};
  std::size_t total_evaluations_{};
};

class timer {
public:
  using clock_t = generation::clock_t;

public:
  inline timer() noexcept
      : start_{clock_t::now()} {
  }

  inline auto elapsed() const noexcept {
    return clock_t::now() - start_;
  }

private:
  clock_t::time_point start_;
};

} // namespace weasel::stats
