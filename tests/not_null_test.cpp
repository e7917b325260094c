#include <nest/core/not_null.hpp>
#include <test/test.hpp>
#include <memory>
#include <type_traits>

namespace {
using namespace nest;

static_assert(PointerLike<int*>);
static_assert(PointerLike<std::shared_ptr<int const>>);
static_assert(!PointerLike<std::nullptr_t>);
static_assert(!PointerLike<int>);
static_assert(!std::is_constructible_v<NotNull<int*>, std::nullptr_t>);

ADD_TEST(NotNull_Access) {
	auto const value = std::make_shared<int const>(42);
	auto const ptr = NotNull<std::shared_ptr<int const>>{value};
	EXPECT(ptr.get() == value);
	EXPECT(*ptr == 42);
	std::shared_ptr<int const> const converted = ptr;
	EXPECT(converted.use_count() == 3);
}
} // namespace
