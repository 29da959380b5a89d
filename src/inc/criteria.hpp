#pragma once

#include "statistics.hpp"

#include <concepts>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace weasel {

template<typename Criterion>
concept criterion = std::is_invocable_r_v<bool,
                                          Criterion,
                                          candidate const&,
                                          stats::history const&>;

} // namespace weasel

namespace weasel::criteria {

class exact_match {
public:
  inline explicit exact_match(std::string target)
      : target_{std::move(target)} {
  }

  inline bool operator()(candidate const& best,
                         stats::history const& /*unused*/) const noexcept {
    return best.chromosome() == target_;
  }

private:
  std::string target_;
};

} // namespace weasel::criteria
