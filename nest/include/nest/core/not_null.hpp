#pragma once
#include <cassert>
#include <concepts>
#include <cstddef>
#include <utility>

namespace nest {
template <typename Type>
concept PointerLike = requires(Type const& t) {
	requires(!std::same_as<Type, std::nullptr_t>);
	t != nullptr;
};

///
/// \brief Pointer-like wrapper that asserts on null.
///
template <PointerLike Type>
class NotNull {
  public:
	NotNull(std::nullptr_t) = delete;
	auto operator=(std::nullptr_t) -> NotNull& = delete;

	template <std::convertible_to<Type> T>
	constexpr NotNull(T&& u) : m_t(std::forward<T>(u)) {
		assert(m_t != nullptr);
	}

	constexpr auto get() const -> Type const& { return m_t; }
	constexpr operator Type() const { return get(); }

	constexpr auto operator*() const -> decltype(auto) { return *get(); }
	constexpr auto operator->() const -> decltype(auto) { return get(); }

  private:
	Type m_t{};
};
} // namespace nest
