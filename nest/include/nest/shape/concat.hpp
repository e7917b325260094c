#pragma once
#include <nest/shape/shape.hpp>
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <vector>

namespace nest {
///
/// \brief Union of any number of shapes of the same type, in order.
///
/// Used to build a shape out of N generated sub-shapes (eg N rotated copies of one petal).
/// Each element is an independent copy: nothing is shared between them except textures.
///
template <typename S>
class Concat : public ShapeOps<Concat<S>> {
	static_assert(Shape<S>);

  public:
	class iterator {
	  public:
		using value_type = RendTri;
		using difference_type = std::ptrdiff_t;
		using iterator_concept = std::forward_iterator_tag;

		using InnerIt = std::ranges::iterator_t<S const>;

		iterator() = default;

		iterator(std::vector<S> const& shapes, std::size_t index) : m_shapes(&shapes), m_index(index) {
			if (m_index < m_shapes->size()) { enter(); }
			settle();
		}

		auto operator*() const -> RendTri { return RendTri{*m_it}; }

		auto operator++() -> iterator& {
			++m_it;
			settle();
			return *this;
		}

		auto operator++(int) -> iterator {
			auto ret = *this;
			++(*this);
			return ret;
		}

		auto operator==(iterator const& rhs) const -> bool { return m_index == rhs.m_index && m_it == rhs.m_it; }

	  private:
		auto enter() -> void {
			auto const& shape = (*m_shapes)[m_index];
			m_it = std::ranges::begin(shape);
			m_end = std::ranges::end(shape);
		}

		// skip exhausted (and empty) shapes; past the last one the inner iterators are reset
		auto settle() -> void {
			if (m_shapes == nullptr) { return; }
			while (m_index < m_shapes->size() && m_it == m_end) {
				if (++m_index < m_shapes->size()) { enter(); }
			}
			if (m_index >= m_shapes->size()) {
				m_index = m_shapes->size();
				m_it = m_end = InnerIt{};
			}
		}

		std::vector<S> const* m_shapes{};
		std::size_t m_index{};
		InnerIt m_it{};
		InnerIt m_end{};
	};

	using const_iterator = iterator;

	Concat() = default;

	explicit Concat(std::vector<S> shapes) : m_shapes(std::move(shapes)) {}

	[[nodiscard]] auto begin() const -> iterator { return iterator{m_shapes, 0}; }
	[[nodiscard]] auto end() const -> iterator { return iterator{m_shapes, m_shapes.size()}; }

	auto push_back(S shape) -> Concat& {
		m_shapes.push_back(std::move(shape));
		return *this;
	}

	[[nodiscard]] auto shapes() const -> std::vector<S> const& { return m_shapes; }
	[[nodiscard]] auto size() const -> std::size_t { return m_shapes.size(); }
	[[nodiscard]] auto empty() const -> bool { return m_shapes.empty(); }

  private:
	std::vector<S> m_shapes{};
};

template <Shape S>
[[nodiscard]] auto concat(std::vector<S> shapes) -> Concat<S> {
	return Concat<S>{std::move(shapes)};
}

///
/// \brief Union of generate(0), generate(1), ... generate(count - 1).
///
template <typename Func>
	requires(Shape<std::invoke_result_t<Func, std::size_t>>)
[[nodiscard]] auto generate(std::size_t count, Func func) -> Concat<std::invoke_result_t<Func, std::size_t>> {
	using S = std::invoke_result_t<Func, std::size_t>;
	auto shapes = std::vector<S>{};
	shapes.reserve(count);
	for (std::size_t index = 0; index < count; ++index) { shapes.push_back(func(index)); }
	return Concat<S>{std::move(shapes)};
}
} // namespace nest
