#pragma once
#include <nest/graphics/bitmap.hpp>
#include <memory>
#include <string>
#include <vector>

namespace nest::graphics {
///
/// \brief Immutable RGBA8 image, shared between triangles via std::shared_ptr<Texture const>.
///
/// Pixels are never read by the shape algebra: only the extent is used (for aspect ratio).
/// Uploading and binding is the renderer's business.
///
class Texture {
  public:
	///
	/// \brief Decode a compressed image (PNG, JPG, PNM, etc) into RGBA8.
	/// \returns nullptr if compressed is empty or cannot be decoded
	///
	[[nodiscard]] static auto decode(std::span<std::byte const> compressed, std::string name = {}) -> std::shared_ptr<Texture const>;

	explicit Texture(Bitmap const& bitmap, std::string name = {});

	[[nodiscard]] auto extent() const -> glm::uvec2 { return m_extent; }
	[[nodiscard]] auto bytes() const -> std::span<std::byte const> { return m_bytes; }
	[[nodiscard]] auto bitmap() const -> Bitmap { return Bitmap{.bytes = m_bytes, .extent = m_extent}; }
	[[nodiscard]] auto name() const -> std::string_view { return m_name; }

	///
	/// \brief Height / width, or 0 if width is 0.
	///
	[[nodiscard]] auto height_per_width() const -> float;
	///
	/// \brief Width / height, or 0 if height is 0.
	///
	[[nodiscard]] auto width_per_height() const -> float;

  private:
	std::vector<std::byte> m_bytes{};
	glm::uvec2 m_extent{};
	std::string m_name{};
};
} // namespace nest::graphics
