#pragma once
#include <glm/vec2.hpp>
#include <cstddef>
#include <span>

namespace nest::graphics {
///
/// \brief Non-owning view of tightly packed RGBA8 pixels.
///
struct Bitmap {
	static constexpr std::size_t channels_v{4};

	std::span<std::byte const> bytes{};
	glm::uvec2 extent{};
};
} // namespace nest::graphics
