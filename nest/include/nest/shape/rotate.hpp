#pragma once
#include <nest/shape/detail/map_iterator.hpp>
#include <nest/shape/shape.hpp>
#include <cmath>

namespace nest {
///
/// \brief Shape with every position rotated about the origin (0, 0).
///
/// Rotation is never about the shape's centre: translate to the pivot, rotate, then translate back.
/// Texture coordinates, colour, and texture are left untouched.
///
template <typename S>
class Rotate : public ShapeOps<Rotate<S>> {
	static_assert(Shape<S>);

  public:
	struct Rotation {
		float cos{1.0f};
		float sin{0.0f};

		auto operator()(RendTri& out) const -> void {
			out.tri.positions.apply([c = cos, s = sin](glm::vec2 const p) { return glm::vec2{p.x * c - p.y * s, p.x * s + p.y * c}; });
		}
	};

	using iterator = detail::MapIterator<std::ranges::iterator_t<S const>, Rotation>;
	using const_iterator = iterator;

	explicit Rotate(S shape, Radians const angle) : m_shape(std::move(shape)), m_angle(angle), m_rotation{std::cos(angle.value), std::sin(angle.value)} {}

	[[nodiscard]] auto begin() const -> iterator { return iterator{std::ranges::begin(m_shape), m_rotation}; }
	[[nodiscard]] auto end() const -> iterator { return iterator{std::ranges::end(m_shape), m_rotation}; }

	[[nodiscard]] auto shape() const -> S const& { return m_shape; }
	[[nodiscard]] auto angle() const -> Radians { return m_angle; }

  private:
	S m_shape;
	Radians m_angle;
	Rotation m_rotation;
};
} // namespace nest
