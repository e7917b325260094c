#pragma once
#include <nest/core/not_null.hpp>
#include <nest/shape/shape.hpp>
#include <array>

namespace nest {
///
/// \brief Axis-aligned rectangle: two corners, two triangles.
///
/// Corners may be passed in any order. The split and winding are fixed:
/// 	0: (first.x, first.y), (second.x, first.y), (first.x, second.y)
/// 	1: (second.x, second.y), (first.x, second.y), (second.x, first.y)
/// New primitives should follow the same vertex order for consistent winding.
///
class Rect : public ShapeOps<Rect> {
  public:
	using const_iterator = std::array<RendTri, 2>::const_iterator;
	using iterator = const_iterator;

	Rect() = default;

	explicit Rect(glm::vec2 first, glm::vec2 second, graphics::Rgba rgba = graphics::white_v);

	///
	/// \brief Rectangle with texture attached to both triangles and unit square texture coordinates.
	///
	static auto textured(glm::vec2 first, glm::vec2 second, NotNull<std::shared_ptr<graphics::Texture const>> const& texture) -> Rect;

	[[nodiscard]] auto begin() const -> const_iterator { return m_tris.begin(); }
	[[nodiscard]] auto end() const -> const_iterator { return m_tris.end(); }

	[[nodiscard]] auto tris() const -> std::array<RendTri, 2> const& { return m_tris; }
	[[nodiscard]] auto first() const -> glm::vec2 { return m_first; }
	[[nodiscard]] auto second() const -> glm::vec2 { return m_second; }

  private:
	std::array<RendTri, 2> m_tris{};
	glm::vec2 m_first{};
	glm::vec2 m_second{};
};

template <Vec2Like A, Vec2Like B>
[[nodiscard]] auto rect(A const& first, B const& second) -> Rect {
	return Rect{to_vec2(first), to_vec2(second)};
}

///
/// \brief Image rectangle of given width, centred at the origin.
///
/// Height is proportional to the texture's native aspect ratio (0 for a texture with no width).
///
[[nodiscard]] auto image_w(NotNull<std::shared_ptr<graphics::Texture const>> const& texture, float width) -> Rect;

///
/// \brief Image rectangle of given height, centred at the origin.
///
[[nodiscard]] auto image_h(NotNull<std::shared_ptr<graphics::Texture const>> const& texture, float height) -> Rect;
} // namespace nest
