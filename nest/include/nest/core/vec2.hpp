#pragma once
#include <glm/vec2.hpp>
#include <concepts>
#include <cstddef>
#include <tuple>
#include <utility>

namespace nest {
///
/// \brief Any type exposing numeric .x and .y members (glm::vec2, user structs).
///
template <typename Type>
concept NamedXY = requires(Type const& t) {
	{ t.x } -> std::convertible_to<float>;
	{ t.y } -> std::convertible_to<float>;
};

///
/// \brief Any tuple-like type of exactly two numeric elements (std::array, std::pair, std::tuple).
///
template <typename Type>
concept TupleXY = requires(Type const& t) {
	requires std::tuple_size<Type>::value == 2;
	{ std::get<0>(t) } -> std::convertible_to<float>;
	{ std::get<1>(t) } -> std::convertible_to<float>;
};

template <typename Type>
concept Vec2Like = NamedXY<Type> || TupleXY<Type>;

template <Vec2Like Type>
constexpr auto to_vec2(Type const& xy) -> glm::vec2 {
	if constexpr (NamedXY<Type>) {
		return {static_cast<float>(xy.x), static_cast<float>(xy.y)};
	} else {
		return {static_cast<float>(std::get<0>(xy)), static_cast<float>(std::get<1>(xy))};
	}
}
} // namespace nest
