#pragma once
#include <concepts>
#include <stdexcept>
#include <utility>
#include <variant>

namespace nest {
template <typename Type>
concept NotVoidT = !std::is_void_v<Type>;

///
/// \brief Either a value or an error, never both.
///
template <NotVoidT Type, NotVoidT ErrorT>
class Result {
  public:
	constexpr Result(Type value) : m_storage(std::in_place_index<i_value>, std::move(value)) {}

	constexpr Result(ErrorT error)
		requires(!std::same_as<Type, ErrorT>)
		: m_storage(std::in_place_index<i_error>, std::move(error)) {}

	static constexpr auto as_error(ErrorT error) -> Result { return Result{std::in_place_index<i_error>, std::move(error)}; }

	[[nodiscard]] constexpr auto has_value() const -> bool { return m_storage.index() == i_value; }
	[[nodiscard]] constexpr auto has_error() const -> bool { return m_storage.index() == i_error; }

	[[nodiscard]] constexpr auto value() const -> Type const& {
		if (!has_value()) { throw std::runtime_error{"Result does not contain a value"}; }
		return std::get<i_value>(m_storage);
	}

	[[nodiscard]] constexpr auto value() -> Type& {
		if (!has_value()) { throw std::runtime_error{"Result does not contain a value"}; }
		return std::get<i_value>(m_storage);
	}

	[[nodiscard]] constexpr auto error() const -> ErrorT const& {
		if (!has_error()) { throw std::runtime_error{"Result does not contain an error"}; }
		return std::get<i_error>(m_storage);
	}

	///
	/// \brief Obtain the value if present, else fallback.
	///
	[[nodiscard]] constexpr auto value_or(Type fallback) const -> Type {
		if (!has_value()) { return fallback; }
		return std::get<i_value>(m_storage);
	}

	constexpr auto operator*() const -> Type const& { return value(); }
	constexpr auto operator->() const -> Type const* { return &value(); }

	explicit constexpr operator bool() const { return has_value(); }

  private:
	static constexpr std::size_t i_value{0};
	static constexpr std::size_t i_error{1};

	template <typename T, std::size_t I>
	constexpr Result(std::in_place_index_t<I> index, T&& t) : m_storage(index, std::forward<T>(t)) {}

	std::variant<Type, ErrorT> m_storage;
};
} // namespace nest
