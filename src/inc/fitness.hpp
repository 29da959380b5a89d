#pragma once

#include <algorithm>
#include <cstddef>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

namespace weasel {

using fitness_t = std::size_t;

// positions past the end of the shorter sequence never match
inline fitness_t count_matches(std::string_view left,
                               std::string_view right) noexcept {
  auto size = std::min(left.size(), right.size());
  return static_cast<fitness_t>(
      std::ranges::count_if(std::views::iota(std::size_t{0}, size),
                            [&](std::size_t i) { return left[i] == right[i]; }));
}

class matching {
public:
  inline explicit matching(std::string target)
      : target_{std::move(target)} {
  }

  inline fitness_t operator()(std::string const& chromosome) const noexcept {
    return count_matches(chromosome, target_);
  }

  inline auto best() const noexcept {
    return static_cast<fitness_t>(target_.size());
  }

private:
  std::string target_;
};

} // namespace weasel
