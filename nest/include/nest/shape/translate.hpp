#pragma once
#include <nest/shape/detail/map_iterator.hpp>
#include <nest/shape/shape.hpp>

namespace nest {
///
/// \brief Shape with every position offset by a vector.
///
/// Texture coordinates, colour, and texture are left untouched.
///
template <typename S>
class Translate : public ShapeOps<Translate<S>> {
	static_assert(Shape<S>);

  public:
	struct Offset {
		glm::vec2 vector{};

		auto operator()(RendTri& out) const -> void {
			out.tri.positions.apply([v = vector](glm::vec2 const p) { return p + v; });
		}
	};

	using iterator = detail::MapIterator<std::ranges::iterator_t<S const>, Offset>;
	using const_iterator = iterator;

	explicit Translate(S shape, glm::vec2 const vector) : m_shape(std::move(shape)), m_offset{vector} {}

	[[nodiscard]] auto begin() const -> iterator { return iterator{std::ranges::begin(m_shape), m_offset}; }
	[[nodiscard]] auto end() const -> iterator { return iterator{std::ranges::end(m_shape), m_offset}; }

	[[nodiscard]] auto shape() const -> S const& { return m_shape; }
	[[nodiscard]] auto vector() const -> glm::vec2 { return m_offset.vector; }

  private:
	S m_shape;
	Offset m_offset;
};
} // namespace nest
