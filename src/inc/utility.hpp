#pragma once

#include <concepts>
#include <type_traits>

namespace weasel::util {

template<typename Ref, typename Decayed>
concept forward_ref = std::same_as<Decayed, std::remove_cvref_t<Ref>>;

template<typename Ty>
struct is_nothrow_forward_constructible
    : std::is_nothrow_copy_constructible<std::decay_t<Ty>> {};

template<typename Ty>
struct is_nothrow_forward_constructible<Ty&&>
    : std::is_nothrow_move_constructible<std::decay_t<Ty>> {};

template<typename... Tys>
struct is_nothrow_forward_constructibles
    : std::conjunction<is_nothrow_forward_constructible<Tys>...> {};

template<typename... Tys>
inline constexpr auto is_nothrow_forward_constructibles_v =
    is_nothrow_forward_constructibles<Tys...>::value;

} // namespace weasel::util
