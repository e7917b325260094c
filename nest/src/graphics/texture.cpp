#include <stb/stb_image.h>
#include <nest/graphics/texture.hpp>
#include <cstdint>
#include <limits>

namespace nest::graphics {
namespace {
struct StbFree {
	auto operator()(stbi_uc* pixels) const -> void { stbi_image_free(pixels); }
};

using StbPixels = std::unique_ptr<stbi_uc, StbFree>;
} // namespace

auto Texture::decode(std::span<std::byte const> const compressed, std::string name) -> std::shared_ptr<Texture const> {
	if (compressed.empty() || compressed.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) { return {}; }

	auto width = int{};
	auto height = int{};
	auto channels = int{};
	auto const* data = reinterpret_cast<stbi_uc const*>(compressed.data()); // NOLINT
	auto const pixels = StbPixels{stbi_load_from_memory(data, static_cast<int>(compressed.size()), &width, &height, &channels, static_cast<int>(Bitmap::channels_v))};
	if (!pixels) { return {}; }

	// stb converts to the requested channel count regardless of the source's
	auto const extent = glm::uvec2{static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height)};
	auto const size = std::size_t{extent.x} * std::size_t{extent.y} * Bitmap::channels_v;
	auto const bytes = std::span{reinterpret_cast<std::byte const*>(pixels.get()), size}; // NOLINT
	return std::make_shared<Texture>(Bitmap{.bytes = bytes, .extent = extent}, std::move(name));
}

Texture::Texture(Bitmap const& bitmap, std::string name)
	: m_bytes(bitmap.bytes.begin(), bitmap.bytes.end()), m_extent(bitmap.extent), m_name(std::move(name)) {}

auto Texture::height_per_width() const -> float {
	if (m_extent.x == 0) { return 0.0f; }
	return static_cast<float>(m_extent.y) / static_cast<float>(m_extent.x);
}

auto Texture::width_per_height() const -> float {
	if (m_extent.y == 0) { return 0.0f; }
	return static_cast<float>(m_extent.x) / static_cast<float>(m_extent.y);
}
} // namespace nest::graphics
