#pragma once

#include "error.hpp"

#include <algorithm>
#include <concepts>
#include <random>
#include <string>
#include <string_view>

namespace weasel {

// uniform draws: index(size) in [0, size - 1], roll(max) in [0, max]
template<typename Source>
concept random_source = requires(Source s, std::size_t n) {
  { s.index(n) } -> std::convertible_to<std::size_t>;
  { s.roll(n) } -> std::convertible_to<std::size_t>;
};

template<std::uniform_random_bit_generator Generator>
class generator_source {
public:
  using generator_t = Generator;

public:
  inline explicit generator_source(generator_t& generator) noexcept
      : generator_{&generator} {
  }

  inline std::size_t index(std::size_t size) {
    return std::uniform_int_distribution<std::size_t>{0, size - 1}(
        *generator_);
  }

  inline std::size_t roll(std::size_t max) {
    return std::uniform_int_distribution<std::size_t>{0, max}(*generator_);
  }

private:
  generator_t* generator_;
};

class charset {
public:
  charset() = default;

  // keeps the first occurrence of each character
  inline explicit charset(std::string_view chars) {
    chars_.reserve(chars.size());
    for (auto c : chars) {
      if (!contains(c)) {
        chars_.push_back(c);
      }
    }
  }

  inline bool contains(char c) const noexcept {
    return chars_.find(c) != std::string::npos;
  }

  inline bool contains_all(std::string_view text) const noexcept {
    return std::ranges::all_of(text, [this](char c) { return contains(c); });
  }

  inline auto empty() const noexcept {
    return chars_.empty();
  }

  inline auto size() const noexcept {
    return chars_.size();
  }

  inline char operator[](std::size_t index) const noexcept {
    return chars_[index];
  }

  inline std::string_view view() const noexcept {
    return chars_;
  }

private:
  std::string chars_;
};

template<random_source Source>
char pick(charset const& chars, Source& source) {
  if (chars.empty()) {
    throw sampling_error("Couldn't pick character from an empty char set");
  }

  return chars[source.index(chars.size())];
}

template<random_source Source>
std::string random_string(std::size_t length,
                          charset const& chars,
                          Source& source) {
  std::string result(length, '\0');
  std::ranges::generate(result,
                        [&chars, &source] { return pick(chars, source); });
  return result;
}

template<random_source Source>
class spawn {
public:
  using source_t = Source;

public:
  inline spawn(source_t& source, charset const& chars, std::size_t length)
      : source_{&source}
      , chars_{chars}
      , length_{length} {
  }

  inline std::string operator()() const {
    return random_string(length_, chars_, *source_);
  }

private:
  source_t* source_;
  charset chars_;
  std::size_t length_;
};

} // namespace weasel
