#pragma once
#include <nest/core/radians.hpp>
#include <nest/core/vec2.hpp>
#include <nest/shape/tri.hpp>
#include <concepts>
#include <ranges>
#include <vector>

namespace nest {
///
/// \brief Anything that yields a finite, restartable sequence of RendTri.
///
/// Iterating a const Shape must not consume or mutate it: the same shape expression is typically drawn every frame.
/// Copies must be cheap (a transform history, not a triangle buffer).
/// begin() and end() must return the same iterator type: combinators store both ends as iterators.
///
template <typename Type>
concept Shape = std::copyable<Type> && std::ranges::forward_range<Type const> && std::ranges::common_range<Type const> &&
				std::same_as<std::ranges::range_value_t<Type const>, RendTri>;

// Shape is asserted inside each combinator: Derived is incomplete when ShapeOps names them
template <typename S>
class Translate;

template <typename S>
class Rotate;

template <typename First, typename Second>
class Combine;

///
/// \brief Combinator member functions for nest shapes (CRTP).
///
/// Available on primitives and combinators alike, which is what lets combinators nest to any depth.
/// Free function equivalents (nest::translate, etc) accept any Shape, including std::vector<RendTri>.
///
template <typename Derived>
class ShapeOps {
  public:
	///
	/// \brief Concatenate another shape after this one.
	///
	template <Shape Rhs>
	[[nodiscard]] auto combine(Rhs rhs) const -> Combine<Derived, Rhs> {
		return Combine<Derived, Rhs>{self(), std::move(rhs)};
	}

	///
	/// \brief Offset every position by vector.
	///
	template <Vec2Like V = glm::vec2>
	[[nodiscard]] auto translate(V const& vector) const -> Translate<Derived> {
		return Translate<Derived>{self(), to_vec2(vector)};
	}

	///
	/// \brief Rotate every position about the origin (0, 0).
	///
	/// Translate before and after to pivot about any other point.
	///
	[[nodiscard]] auto rotate(Radians const angle) const -> Rotate<Derived> { return Rotate<Derived>{self(), angle}; }

  private:
	[[nodiscard]] auto self() const -> Derived const& { return static_cast<Derived const&>(*this); }
};

template <Shape S, Vec2Like V = glm::vec2>
[[nodiscard]] auto translate(S const& shape, V const& vector) -> Translate<S> {
	return Translate<S>{shape, to_vec2(vector)};
}

template <Shape S>
[[nodiscard]] auto rotate(S const& shape, Radians const angle) -> Rotate<S> {
	return Rotate<S>{shape, angle};
}

template <Shape First, Shape Second>
[[nodiscard]] auto combine(First first, Second second) -> Combine<First, Second> {
	return Combine<First, Second>{std::move(first), std::move(second)};
}

///
/// \brief Materialize every triangle of shape into a vector (itself a Shape).
///
template <Shape S>
[[nodiscard]] auto collect(S const& shape) -> std::vector<RendTri> {
	auto ret = std::vector<RendTri>{};
	for (auto const& tri : shape) { ret.push_back(tri); }
	return ret;
}

template <Shape S>
[[nodiscard]] auto count(S const& shape) -> std::size_t {
	auto ret = std::size_t{};
	for (auto it = std::ranges::begin(shape); it != std::ranges::end(shape); ++it) { ++ret; }
	return ret;
}
} // namespace nest

// combinator definitions
#include <nest/shape/combine.hpp>
#include <nest/shape/rotate.hpp>
#include <nest/shape/translate.hpp>
