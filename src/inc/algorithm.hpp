#pragma once

#include "configuration.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <concepts>
#include <functional>
#include <stop_token>
#include <utility>

namespace weasel {

template<typename Config>
concept algo_config = requires(Config c) {
  requires initializator<typename Config::initializator_t>;
  requires evaluator<typename Config::evaluator_t>;
  requires mutation<typename Config::mutation_t>;
  requires criterion<typename Config::criterion_t>;

  { c.batch_size() } -> std::convertible_to<std::size_t>;
};

enum class algo_state { initializing, evaluating, converged };

template<algo_config Config>
class algo {
public:
  using config_t = Config;

public:
  inline explicit algo(config_t const& config)
      : config_{config} {
  }

  candidate const& run(std::stop_token token) {
    init();

    do {
      evolve();

      if (std::invoke(config_.criterion(), best_, statistics_)) {
        state_ = algo_state::converged;
      }
    } while (state_ != algo_state::converged && !token.stop_requested());

    if (state_ == algo_state::converged) {
      spdlog::debug("converged after {} generations and {} evaluations",
                    statistics_.recorded(),
                    statistics_.total_evaluations());
    }

    return best_;
  }

  inline auto state() const noexcept {
    return state_;
  }

  inline auto const& best() const noexcept {
    return best_;
  }

  inline auto const& statistics() const noexcept {
    return statistics_;
  }

private:
  void init() {
    state_ = algo_state::initializing;

    auto chromosome = std::invoke(config_.initializator());
    best_ = evaluate(std::move(chromosome));

    config_.observers().observe(start_event, std::as_const(best_));
    state_ = algo_state::evaluating;
  }

  void evolve() {
    stats::timer timer{};

    // ties keep the candidate found first
    auto working = best_;
    for (auto i = config_.batch_size(); i > 0; --i) {
      auto child = best_.chromosome();
      std::invoke(config_.mutation(), child);

      if (auto offspring = evaluate(std::move(child));
          offspring.better_than(working)) {
        working = std::move(offspring);
      }
    }

    auto improved = working.better_than(best_);
    best_ = std::move(working);

    auto const& current = statistics_.next(stats::generation{generation_,
                                                             best_.fitness(),
                                                             improved,
                                                             config_.batch_size(),
                                                             timer.elapsed()});

    spdlog::debug(
        "generation {}: fitness {}{} in {}us",
        current.number(),
        current.best_fitness(),
        current.improved() ? " (improved)" : "",
        std::chrono::duration_cast<std::chrono::microseconds>(current.elapsed())
            .count());

    config_.observers().observe(
        generation_event, std::as_const(best_), std::as_const(statistics_));

    ++generation_;
  }

  inline candidate evaluate(chromosome_t&& chromosome) const {
    auto fitness = std::invoke(config_.evaluator(), std::as_const(chromosome));
    return candidate{std::move(chromosome), fitness};
  }

private:
  config_t config_;
  stats::history statistics_{};

  candidate best_{};
  std::size_t generation_{};
  algo_state state_{algo_state::initializing};
};

} // namespace weasel
