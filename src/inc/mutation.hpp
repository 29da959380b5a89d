#pragma once

#include "individual.hpp"
#include "sampling.hpp"

#include <string_view>

namespace weasel::mutate {

// rolls are drawn from [0, max_rate] and trigger a mutation when <= rate
inline constexpr std::size_t max_rate = 100;

template<random_source Source>
class replace {
public:
  using source_t = Source;

public:
  inline replace(source_t& source, charset const& chars, std::size_t rate)
      : source_{&source}
      , chars_{chars}
      , rate_{rate} {
  }

  void operator()(chromosome_t& target) const {
    for (auto& gene : target) {
      if (source_->roll(max_rate) <= rate_) {
        gene = pick(chars_, *source_);
      }
    }
  }

  inline auto rate() const noexcept {
    return rate_;
  }

private:
  source_t* source_;
  charset chars_;
  std::size_t rate_;
};

template<typename Mutation>
inline chromosome_t mutated(Mutation const& mutation, std::string_view base) {
  chromosome_t result{base};
  mutation(result);
  return result;
}

} // namespace weasel::mutate
