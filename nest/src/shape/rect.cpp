#include <nest/graphics/texture.hpp>
#include <nest/shape/rect.hpp>

namespace nest {
namespace {
// unit square, (0, 0) at first corner
auto const uvs_v = std::array<std::array<glm::vec2, 3>, 2>{{
	{glm::vec2{0.0f, 0.0f}, glm::vec2{1.0f, 0.0f}, glm::vec2{0.0f, 1.0f}},
	{glm::vec2{1.0f, 1.0f}, glm::vec2{0.0f, 1.0f}, glm::vec2{1.0f, 0.0f}},
}};

auto centred(glm::vec2 const size) -> std::array<glm::vec2, 2> {
	auto const half = 0.5f * size;
	return {-half, half};
}
} // namespace

Rect::Rect(glm::vec2 const first, glm::vec2 const second, graphics::Rgba const rgba) : m_first(first), m_second(second) {
	auto const& a = first;
	auto const& b = second;
	m_tris[0] = Tri::make({glm::vec2{a.x, a.y}, glm::vec2{b.x, a.y}, glm::vec2{a.x, b.y}}, {}, rgba);
	m_tris[1] = Tri::make({glm::vec2{b.x, b.y}, glm::vec2{a.x, b.y}, glm::vec2{b.x, a.y}}, {}, rgba);
}

auto Rect::textured(glm::vec2 const first, glm::vec2 const second, NotNull<std::shared_ptr<graphics::Texture const>> const& texture) -> Rect {
	auto ret = Rect{first, second};
	for (std::size_t index = 0; index < ret.m_tris.size(); ++index) {
		auto& tri = ret.m_tris.at(index);
		tri.tri.texcoords = Positions{uvs_v.at(index)};
		tri.texture = texture.get();
	}
	return ret;
}

auto image_w(NotNull<std::shared_ptr<graphics::Texture const>> const& texture, float const width) -> Rect {
	auto const [lb, rt] = centred({width, width * texture->height_per_width()});
	return Rect::textured(lb, rt, texture);
}

auto image_h(NotNull<std::shared_ptr<graphics::Texture const>> const& texture, float const height) -> Rect {
	auto const [lb, rt] = centred({height * texture->width_per_height(), height});
	return Rect::textured(lb, rt, texture);
}
} // namespace nest
