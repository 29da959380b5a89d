#pragma once

#include "fitness.hpp"
#include "utility.hpp"

#include <string>
#include <utility>

namespace weasel {

using chromosome_t = std::string;

class candidate {
public:
  candidate() = default;

  template<util::forward_ref<chromosome_t> C>
  inline candidate(C&& chromosome, fitness_t fitness) noexcept(
      util::is_nothrow_forward_constructibles_v<decltype(chromosome)>)
      : chromosome_{std::forward<C>(chromosome)}
      , fitness_{fitness} {
  }

  inline auto const& chromosome() const noexcept {
    return chromosome_;
  }

  inline auto fitness() const noexcept {
    return fitness_;
  }

  inline bool better_than(candidate const& other) const noexcept {
    return fitness_ > other.fitness_;
  }

  friend bool operator==(candidate const&, candidate const&) = default;

private:
  chromosome_t chromosome_;
  fitness_t fitness_{};
};

} // namespace weasel
