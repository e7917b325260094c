#pragma once
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include <nest/shape/shape.hpp>
#include <memory>
#include <span>
#include <vector>

namespace nest::graphics {
class Texture;

struct Vertex {
	glm::vec2 position{};
	glm::vec2 uv{};
	glm::vec4 rgba{1.0f};
};

///
/// \brief Run of consecutive triangles sharing one texture (or none).
///
struct DrawBatch {
	std::shared_ptr<Texture const> texture{};
	std::vector<Vertex> vertices{};

	[[nodiscard]] auto triangle_count() const -> std::size_t { return vertices.size() / 3; }
};

///
/// \brief Vertex data drained from shapes, ready for upload.
///
/// Triangles are expanded to three vertices each in winding order, emission order is preserved.
/// A new batch begins whenever the texture (compared by identity) changes.
///
class DrawList {
  public:
	auto push(RendTri const& tri) -> DrawList&;

	template <Shape S>
	auto append(S const& shape) -> DrawList& {
		for (auto const& tri : shape) { push(tri); }
		return *this;
	}

	auto clear() -> void { m_batches.clear(); }

	[[nodiscard]] auto batches() const -> std::span<DrawBatch const> { return m_batches; }
	[[nodiscard]] auto triangle_count() const -> std::size_t;
	[[nodiscard]] auto vertex_count() const -> std::size_t;
	[[nodiscard]] auto is_empty() const -> bool { return m_batches.empty(); }

  private:
	std::vector<DrawBatch> m_batches{};
};
} // namespace nest::graphics
