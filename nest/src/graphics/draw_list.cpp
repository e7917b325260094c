#include <nest/graphics/draw_list.hpp>
#include <nest/graphics/texture.hpp>
#include <numeric>

namespace nest::graphics {
auto DrawList::push(RendTri const& tri) -> DrawList& {
	if (m_batches.empty() || m_batches.back().texture != tri.texture) { m_batches.push_back(DrawBatch{.texture = tri.texture}); }
	auto& vertices = m_batches.back().vertices;
	for (std::size_t index = 0; index < 3; ++index) {
		vertices.push_back(Vertex{.position = tri.tri.positions[index], .uv = tri.tri.texcoords[index], .rgba = tri.tri.rgba});
	}
	return *this;
}

auto DrawList::triangle_count() const -> std::size_t {
	return std::accumulate(m_batches.begin(), m_batches.end(), std::size_t{}, [](std::size_t sum, DrawBatch const& batch) { return sum + batch.triangle_count(); });
}

auto DrawList::vertex_count() const -> std::size_t {
	return std::accumulate(m_batches.begin(), m_batches.end(), std::size_t{}, [](std::size_t sum, DrawBatch const& batch) { return sum + batch.vertices.size(); });
}
} // namespace nest::graphics
