#pragma once
#include <nest/shape/tri.hpp>
#include <cstddef>
#include <iterator>

namespace nest::detail {
///
/// \brief Forward iterator that applies Op to a copy of each RendTri of an underlying iterator.
///
/// Op: void(RendTri&) const, must be default constructible.
///
template <typename It, typename Op>
class MapIterator {
  public:
	using value_type = RendTri;
	using difference_type = std::ptrdiff_t;
	using iterator_concept = std::forward_iterator_tag;

	MapIterator() = default;

	constexpr MapIterator(It it, Op op) : m_it(std::move(it)), m_op(op) {}

	auto operator*() const -> RendTri {
		auto ret = RendTri{*m_it};
		m_op(ret);
		return ret;
	}

	auto operator++() -> MapIterator& {
		++m_it;
		return *this;
	}

	auto operator++(int) -> MapIterator {
		auto ret = *this;
		++m_it;
		return ret;
	}

	auto operator==(MapIterator const& rhs) const -> bool { return m_it == rhs.m_it; }

  private:
	It m_it{};
	Op m_op{};
};
} // namespace nest::detail
