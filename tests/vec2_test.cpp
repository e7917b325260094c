#include <nest/core/radians.hpp>
#include <nest/core/vec2.hpp>
#include <test/compare.hpp>
#include <test/test.hpp>
#include <array>
#include <tuple>
#include <utility>

namespace {
using namespace nest;

struct Point {
	double x{};
	double y{};
};

static_assert(Vec2Like<glm::vec2>);
static_assert(Vec2Like<Point>);
static_assert(Vec2Like<std::array<float, 2>>);
static_assert(Vec2Like<std::pair<int, float>>);
static_assert(Vec2Like<std::tuple<float, double>>);
static_assert(!Vec2Like<std::array<float, 3>>);
static_assert(!Vec2Like<std::tuple<float>>);
static_assert(!Vec2Like<float>);

ADD_TEST(Vec2_Convert) {
	auto const expected = glm::vec2{0.5f, -0.25f};
	EXPECT(to_vec2(glm::vec2{0.5f, -0.25f}) == expected);
	EXPECT(to_vec2(Point{0.5, -0.25}) == expected);
	EXPECT(to_vec2(std::array{0.5f, -0.25f}) == expected);
	EXPECT(to_vec2(std::pair{0.5f, -0.25}) == expected);
	EXPECT(to_vec2(std::tuple{0.5, -0.25f}) == expected);
	EXPECT(to_vec2(std::pair{2, 3}) == glm::vec2{2.0f, 3.0f});
}

ADD_TEST(Radians_Degrees) {
	EXPECT(test::is_near(Radians{Degrees{180.0f}}.value, pi_v));
	EXPECT(test::is_near(Degrees{Radians{pi_v / 2.0f}}.value, 90.0f));
	EXPECT(test::is_near(tau_v, 2.0f * pi_v));
}
} // namespace
