#pragma once
#include <nest/shape/shape.hpp>
#include <cstddef>
#include <iterator>

namespace nest {
///
/// \brief Union of two shapes: all triangles of First, then all triangles of Second.
///
/// No interleaving or reordering: emission order is the only z-order.
///
template <typename First, typename Second>
class Combine : public ShapeOps<Combine<First, Second>> {
	static_assert(Shape<First> && Shape<Second>);

  public:
	class iterator {
	  public:
		using value_type = RendTri;
		using difference_type = std::ptrdiff_t;
		using iterator_concept = std::forward_iterator_tag;

		using FirstIt = std::ranges::iterator_t<First const>;
		using SecondIt = std::ranges::iterator_t<Second const>;

		iterator() = default;

		iterator(FirstIt first, FirstIt first_end, SecondIt second)
			: m_first(std::move(first)), m_first_end(std::move(first_end)), m_second(std::move(second)) {}

		auto operator*() const -> RendTri {
			if (m_first != m_first_end) { return RendTri{*m_first}; }
			return RendTri{*m_second};
		}

		auto operator++() -> iterator& {
			if (m_first != m_first_end) {
				++m_first;
			} else {
				++m_second;
			}
			return *this;
		}

		auto operator++(int) -> iterator {
			auto ret = *this;
			++(*this);
			return ret;
		}

		auto operator==(iterator const& rhs) const -> bool { return m_first == rhs.m_first && m_second == rhs.m_second; }

	  private:
		FirstIt m_first{};
		FirstIt m_first_end{};
		SecondIt m_second{};
	};

	using const_iterator = iterator;

	explicit Combine(First first, Second second) : m_first(std::move(first)), m_second(std::move(second)) {}

	[[nodiscard]] auto begin() const -> iterator { return iterator{std::ranges::begin(m_first), std::ranges::end(m_first), std::ranges::begin(m_second)}; }
	[[nodiscard]] auto end() const -> iterator { return iterator{std::ranges::end(m_first), std::ranges::end(m_first), std::ranges::end(m_second)}; }

	[[nodiscard]] auto first() const -> First const& { return m_first; }
	[[nodiscard]] auto second() const -> Second const& { return m_second; }

  private:
	First m_first;
	Second m_second;
};
} // namespace nest
