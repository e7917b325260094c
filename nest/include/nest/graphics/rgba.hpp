#pragma once
#include <glm/common.hpp>
#include <glm/vec4.hpp>
#include <cstdint>

namespace nest::graphics {
///
/// \brief 4-channel 8-bit colour.
///
struct Rgba {
	static constexpr std::uint8_t max_v{0xff};

	glm::tvec4<std::uint8_t> channels{max_v, max_v, max_v, max_v};

	static constexpr auto to_f32(std::uint8_t channel) -> float { return static_cast<float>(channel) / static_cast<float>(max_v); }
	///
	/// \brief Convert a normalized channel to 8 bits, clamping to [0-1] (NaN maps to 0).
	///
	static constexpr auto to_u8(float normalized) -> std::uint8_t {
		if (normalized != normalized) { return 0; } // NOLINT(misc-redundant-expression)
		return static_cast<std::uint8_t>(glm::clamp(normalized, 0.0f, 1.0f) * static_cast<float>(max_v));
	}

	///
	/// \brief Construct an Rgba instance from normalized [0-1] channels.
	///
	static constexpr auto from(glm::vec4 const& normalized) -> Rgba {
		return {.channels = {to_u8(normalized.x), to_u8(normalized.y), to_u8(normalized.z), to_u8(normalized.w)}};
	}

	///
	/// \brief Convert instance to 4 channel normalized output.
	///
	[[nodiscard]] constexpr auto to_vec4() const -> glm::vec4 {
		return glm::vec4{to_f32(channels.x), to_f32(channels.y), to_f32(channels.z), to_f32(channels.w)};
	}

	auto operator==(Rgba const&) const -> bool = default;
};

constexpr auto blank_v = Rgba{{0x0, 0x0, 0x0, 0x0}};
constexpr auto white_v = Rgba{{0xff, 0xff, 0xff, 0xff}};
constexpr auto black_v = Rgba{{0x0, 0x0, 0x0, 0xff}};
constexpr auto red_v = Rgba{{0xff, 0x0, 0x0, 0xff}};
constexpr auto green_v = Rgba{{0x0, 0xff, 0x0, 0xff}};
constexpr auto blue_v = Rgba{{0x0, 0x0, 0xff, 0xff}};
constexpr auto yellow_v = Rgba{{0xff, 0xff, 0x0, 0xff}};
constexpr auto magenta_v = Rgba{{0xff, 0x0, 0xff, 0xff}};
constexpr auto cyan_v = Rgba{{0x0, 0xff, 0xff, 0xff}};
} // namespace nest::graphics
