#pragma once
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include <nest/graphics/rgba.hpp>
#include <array>
#include <memory>

namespace nest {
namespace graphics {
class Texture;
}

///
/// \brief Three ordered 2D points: space positions or texture coordinates of a triangle.
///
/// Order (winding) is never changed by any transform.
///
struct Positions {
	std::array<glm::vec2, 3> points{};

	template <typename Func>
	[[nodiscard]] constexpr auto map(Func func) const -> Positions {
		return Positions{{func(points[0]), func(points[1]), func(points[2])}};
	}

	template <typename Func>
	constexpr auto apply(Func func) -> void {
		for (auto& point : points) { point = func(point); }
	}

	constexpr auto operator[](std::size_t index) const -> glm::vec2 const& { return points[index]; }
	constexpr auto operator[](std::size_t index) -> glm::vec2& { return points[index]; }

	[[nodiscard]] constexpr auto begin() const { return points.begin(); }
	[[nodiscard]] constexpr auto end() const { return points.end(); }

	auto operator==(Positions const&) const -> bool = default;
};

///
/// \brief The only primitive in nest: three positions, three texture coordinates, one colour.
///
struct Tri {
	Positions positions{};
	Positions texcoords{};
	glm::vec4 rgba{1.0f};

	static constexpr auto make(std::array<glm::vec2, 3> const& positions, std::array<glm::vec2, 3> const& texcoords, graphics::Rgba rgba) -> Tri {
		return Tri{.positions = {positions}, .texcoords = {texcoords}, .rgba = rgba.to_vec4()};
	}

	///
	/// \brief Single-colour (white) triangle with all texture coordinates at (0, 0).
	///
	static constexpr auto from_positions(std::array<glm::vec2, 3> const& positions) -> Tri {
		return make(positions, {}, graphics::white_v);
	}

	auto operator==(Tri const&) const -> bool = default;
};

///
/// \brief Renderable triangle: a Tri and an optional shared texture.
///
/// Texture is shared (reference counted) between all triangles that use it; null means flat colour.
///
struct RendTri {
	Tri tri{};
	std::shared_ptr<graphics::Texture const> texture{};

	RendTri() = default;
	RendTri(Tri tri, std::shared_ptr<graphics::Texture const> texture = {}) : tri(tri), texture(std::move(texture)) {}

	template <typename Func>
	[[nodiscard]] auto map_positions(Func func) const -> RendTri {
		return {Tri{tri.positions.map(func), tri.texcoords, tri.rgba}, texture};
	}

	template <typename Func>
	[[nodiscard]] auto map_texcoords(Func func) const -> RendTri {
		return {Tri{tri.positions, tri.texcoords.map(func), tri.rgba}, texture};
	}

	template <typename Func>
	[[nodiscard]] auto map_rgba(Func func) const -> RendTri {
		return {Tri{tri.positions, tri.texcoords, func(tri.rgba)}, texture};
	}

	[[nodiscard]] auto with_texture(std::shared_ptr<graphics::Texture const> replacement) const -> RendTri { return {tri, std::move(replacement)}; }
};
} // namespace nest
