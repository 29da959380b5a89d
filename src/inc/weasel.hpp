#pragma once

#include "algorithm.hpp"
#include "mutation.hpp"
#include "printing.hpp"
#include "settings.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <ostream>
#include <random>
#include <stop_token>

namespace weasel {

// expects validated settings
template<std::uniform_random_bit_generator Generator>
candidate run(settings const& options,
              Generator& generator,
              std::ostream& output,
              std::stop_token token = {}) {
  generator_source source{generator};
  charset chars{options.charset};

  if (!chars.empty() && !chars.contains_all(options.phrase)) {
    spdlog::warn("char set is missing characters of the phrase, the run "
                 "will not converge");
  }

  auto engine =
      config::begin()
          .batch(static_cast<std::size_t>(options.iterations))
          .spawn(spawn{source, chars, options.phrase.size()})
          .evaluate(matching{options.phrase})
          .mutate(mutate::replace{
              source, chars, static_cast<std::size_t>(options.mutation_rate)})
          .stop(criteria::exact_match{options.phrase})
          .observe(observe{start_event, print_start{output}},
                   observe{generation_event, print_generation{output}})
          .template build<algo>();

  return engine.run(token);
}

inline candidate run(settings const& options, std::ostream& output) {
  auto seed = options.seed ? *options.seed
                           : static_cast<std::uint64_t>(std::random_device{}());
  spdlog::debug("random seed {}", seed);

  std::seed_seq sequence{static_cast<std::uint32_t>(seed),
                         static_cast<std::uint32_t>(seed >> 32)};
  std::mt19937 generator{sequence};
  return run(options, generator, output);
}

} // namespace weasel
