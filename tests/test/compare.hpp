#pragma once
#include <glm/vec2.hpp>
#include <glm/vec4.hpp>
#include <nest/shape/shape.hpp>
#include <cmath>
#include <vector>

namespace test {
inline constexpr auto epsilon_v{0.0001f};

inline auto is_near(float const a, float const b, float const epsilon = epsilon_v) -> bool { return std::abs(a - b) <= epsilon; }

inline auto is_near(glm::vec2 const a, glm::vec2 const b, float const epsilon = epsilon_v) -> bool {
	return is_near(a.x, b.x, epsilon) && is_near(a.y, b.y, epsilon);
}

inline auto is_near(nest::Positions const& a, nest::Positions const& b, float const epsilon = epsilon_v) -> bool {
	for (std::size_t index = 0; index < 3; ++index) {
		if (!is_near(a[index], b[index], epsilon)) { return false; }
	}
	return true;
}

///
/// \brief Same triangles in the same order: positions within epsilon, everything else exact.
///
template <nest::Shape A, nest::Shape B>
auto is_near(A const& a, B const& b, float const epsilon = epsilon_v) -> bool {
	auto const lhs = nest::collect(a);
	auto const rhs = nest::collect(b);
	if (lhs.size() != rhs.size()) { return false; }
	for (std::size_t index = 0; index < lhs.size(); ++index) {
		auto const& l = lhs[index];
		auto const& r = rhs[index];
		if (!is_near(l.tri.positions, r.tri.positions, epsilon)) { return false; }
		if (l.tri.texcoords != r.tri.texcoords || l.tri.rgba != r.tri.rgba || l.texture != r.texture) { return false; }
	}
	return true;
}
} // namespace test
