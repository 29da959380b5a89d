#pragma once

#include "statistics.hpp"

#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace weasel {

struct start_event_t {};
inline constexpr start_event_t start_event{};

struct generation_event_t {};
inline constexpr generation_event_t generation_event{};

template<typename Event>
struct observer_definition;

template<>
struct observer_definition<start_event_t> {
  template<typename Observer>
  inline static constexpr auto satisfies =
      std::is_invocable_v<Observer, candidate const&>;
};

template<>
struct observer_definition<generation_event_t> {
  template<typename Observer>
  inline static constexpr auto satisfies =
      std::is_invocable_v<Observer, candidate const&, stats::history const&>;
};

template<typename Observer, typename Event>
concept observer = observer_definition<Event>::template satisfies<Observer>;

template<typename Event, typename Observer>
  requires observer<Observer, Event>
class observe {
public:
  using event_t = Event;
  using observer_t = Observer;

public:
  inline constexpr observe(event_t /*unused*/, observer_t const& observer)
      : observer_{observer} {
  }

  inline constexpr observe(event_t /*unused*/, observer_t&& observer)
      : observer_{std::move(observer)} {
  }

  inline auto&& observer() && noexcept {
    return std::move(observer_);
  }

  inline auto& observer() & noexcept {
    return observer_;
  }

private:
  observer_t observer_;
};

namespace details {

  template<typename Event, typename... Observes>
  struct event_index_impl;

  template<typename Event>
  struct event_index_impl<Event> {
    inline static constexpr auto found = false;
    inline static constexpr std::size_t value = 0;
  };

  template<typename Event, typename First, typename... Rest>
  struct event_index_impl<Event, First, Rest...> {
    using next_t = event_index_impl<Event, Rest...>;

    inline static constexpr auto found =
        std::is_same_v<Event, typename First::event_t> || next_t::found;

    inline static constexpr std::size_t value =
        std::is_same_v<Event, typename First::event_t> ? 0
                                                       : next_t::value + 1;
  };

} // namespace details

template<typename... Observes>
class observer_pack {
private:
  using observers_t = std::tuple<typename Observes::observer_t...>;

public:
  inline constexpr explicit observer_pack(Observes&&... observes)
      : observers_{std::move(observes).observer()...} {
  }

  template<typename Event, typename... Args>
  inline void observe(Event /*unused*/, Args&&... args) {
    using index_t = details::event_index_impl<Event, Observes...>;

    if constexpr (index_t::found) {
      std::invoke(std::get<index_t::value>(observers_),
                  std::forward<Args>(args)...);
    }
  }

private:
  observers_t observers_;
};

} // namespace weasel
