#pragma once

#include "individual.hpp"

#include <concepts>
#include <type_traits>

namespace weasel {

template<typename Operation>
concept initializator = std::is_invocable_r_v<chromosome_t, Operation>;

template<typename Operation>
concept mutation = std::is_invocable_r_v<
    void,
    Operation,
    std::add_lvalue_reference_t<chromosome_t>>;

template<typename Operation>
concept evaluator = std::is_invocable_r_v<
    fitness_t,
    Operation,
    std::add_lvalue_reference_t<std::add_const_t<chromosome_t>>>;

} // namespace weasel
