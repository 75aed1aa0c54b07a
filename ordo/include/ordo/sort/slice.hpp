/*
 * File: slice.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <bit>
#include <cstddef>
#include <numeric>
#include <span>
#include <utility>
#include <vector>

#include "ordo/core/concepts.hpp"

namespace ordo::sort {

	/*
	 * In-place sorts driven by an index predicate: less(i, j) is asked about
	 * the elements currently stored at positions i and j, and the routines
	 * swap elements around it. Fewer than two elements never reach the
	 * predicate.
	 */

	namespace detail {

		template <typename T>
		inline void swap_at(std::span<T> data, std::size_t i, std::size_t j) {
			using std::swap;
			swap(data[i], data[j]);
		}

		template <typename T, core::concepts::IndexLess LessT>
		void insertion_sort(std::span<T> data, const LessT& less, std::size_t a, std::size_t b) {
			for (std::size_t i = a + 1; i < b; ++i) {
				for (std::size_t j = i; j > a && less(j, j - 1); --j) {
					swap_at(data, j, j - 1);
				}
			}
		}

		// Max-heap on data[first + lo, first + hi).
		template <typename T, core::concepts::IndexLess LessT>
		void sift_down(std::span<T> data, const LessT& less, std::size_t lo, std::size_t hi, std::size_t first) {
			std::size_t root = lo;
			while (true) {
				std::size_t child = 2 * root + 1;
				if (child >= hi) {
					return;
				}
				if (child + 1 < hi && less(first + child, first + child + 1)) {
					++child;
				}
				if (!less(first + root, first + child)) {
					return;
				}
				swap_at(data, first + root, first + child);
				root = child;
			}
		}

		template <typename T, core::concepts::IndexLess LessT>
		void heap_sort(std::span<T> data, const LessT& less, std::size_t a, std::size_t b) {
			const std::size_t hi = b - a;
			for (std::size_t i = hi / 2; i-- > 0;) {
				sift_down(data, less, i, hi, a);
			}
			for (std::size_t i = hi; i-- > 1;) {
				swap_at(data, a, a + i);
				sift_down(data, less, 0, i, a);
			}
		}

		// Leaves the median of data[m0], data[m1], data[m2] at m1.
		template <typename T, core::concepts::IndexLess LessT>
		void median_of_three(std::span<T> data, const LessT& less, std::size_t m1, std::size_t m0, std::size_t m2) {
			if (less(m1, m0)) {
				swap_at(data, m1, m0);
			}
			if (less(m2, m1)) {
				swap_at(data, m2, m1);
				if (less(m1, m0)) {
					swap_at(data, m1, m0);
				}
			}
		}

		// Pivot is kept at index a while partitioning, then moved to its final slot.
		template <typename T, core::concepts::IndexLess LessT>
		std::size_t partition(std::span<T> data, const LessT& less, std::size_t a, std::size_t b) {
			median_of_three(data, less, a, a + (b - a) / 2, b - 1);
			std::size_t i = a + 1;
			std::size_t j = b - 1;
			while (true) {
				while (i <= j && less(i, a)) {
					++i;
				}
				while (i <= j && less(a, j)) {
					--j;
				}
				if (i >= j) {
					break;
				}
				swap_at(data, i, j);
				++i;
				--j;
			}
			swap_at(data, a, j);
			return j;
		}

		template <typename T, core::concepts::IndexLess LessT>
		void intro_sort(std::span<T> data, const LessT& less, std::size_t a, std::size_t b, std::size_t depth) {
			constexpr std::size_t small_range = 12;
			while (b - a > small_range) {
				if (depth == 0) {
					heap_sort(data, less, a, b);
					return;
				}
				--depth;
				const auto p = partition(data, less, a, b);
				if (p - a < b - p) {
					intro_sort(data, less, a, p, depth);
					a = p + 1;
				}
				else {
					intro_sort(data, less, p + 1, b, depth);
					b = p;
				}
			}
			if (b - a > 1) {
				insertion_sort(data, less, a, b);
			}
		}

		// Merges the sorted runs [a, m) and [m, b) in place.
		template <typename T, core::concepts::IndexLess LessT>
		void sym_merge(std::span<T> data, const LessT& less, std::size_t a, std::size_t m, std::size_t b) {
			if (m - a == 1) {
				std::size_t i = m;
				std::size_t j = b;
				while (i < j) {
					const std::size_t h = i + (j - i) / 2;
					if (less(h, a)) {
						i = h + 1;
					}
					else {
						j = h;
					}
				}
				for (std::size_t k = a; k + 1 < i; ++k) {
					swap_at(data, k, k + 1);
				}
				return;
			}
			if (b - m == 1) {
				std::size_t i = a;
				std::size_t j = m;
				while (i < j) {
					const std::size_t h = i + (j - i) / 2;
					if (!less(m, h)) {
						i = h + 1;
					}
					else {
						j = h;
					}
				}
				for (std::size_t k = m; k > i; --k) {
					swap_at(data, k, k - 1);
				}
				return;
			}

			const std::size_t mid = a + (b - a) / 2;
			const std::size_t n = mid + m;
			std::size_t start = a;
			std::size_t r = m;
			if (m > mid) {
				start = n - b;
				r = mid;
			}
			const std::size_t p = n - 1;
			while (start < r) {
				const std::size_t c = start + (r - start) / 2;
				if (!less(p - c, c)) {
					start = c + 1;
				}
				else {
					r = c;
				}
			}

			const std::size_t end = n - start;
			if (start < m && m < end) {
				std::rotate(data.begin() + start, data.begin() + m, data.begin() + end);
			}
			if (a < start && start < mid) {
				sym_merge(data, less, a, start, mid);
			}
			if (mid < end && end < b) {
				sym_merge(data, less, mid, end, b);
			}
		}
	}

	template <typename T, core::concepts::IndexLess LessT>
	void sort_slice(std::span<T> data, const LessT& less) {
		const std::size_t n = data.size();
		if (n < 2) {
			return;
		}
		const std::size_t depth = 2 * static_cast<std::size_t>(std::bit_width(n));
		detail::intro_sort(data, less, 0, n, depth);
	}

	template <typename T, typename A, core::concepts::IndexLess LessT>
	void sort_slice(std::vector<T, A>& data, const LessT& less) {
		sort_slice(std::span<T>(data), less);
	}

	// Equal elements keep their relative order.
	template <typename T, core::concepts::IndexLess LessT>
	void sort_slice_stable(std::span<T> data, const LessT& less) {
		const std::size_t n = data.size();
		if (n < 2) {
			return;
		}

		std::size_t block = 20;
		std::size_t a = 0;
		std::size_t b = block;
		while (b <= n) {
			detail::insertion_sort(data, less, a, b);
			a = b;
			b += block;
		}
		detail::insertion_sort(data, less, a, n);

		while (block < n) {
			a = 0;
			b = 2 * block;
			while (b <= n) {
				detail::sym_merge(data, less, a, a + block, b);
				a = b;
				b += 2 * block;
			}
			if (const auto m = a + block; m < n) {
				detail::sym_merge(data, less, a, m, n);
			}
			block *= 2;
		}
	}

	template <typename T, typename A, core::concepts::IndexLess LessT>
	void sort_slice_stable(std::vector<T, A>& data, const LessT& less) {
		sort_slice_stable(std::span<T>(data), less);
	}

	template <core::concepts::IndexLess LessT>
	bool is_sorted(std::size_t n, const LessT& less) {
		for (std::size_t i = n; i-- > 1;) {
			if (less(i, i - 1)) {
				return false;
			}
		}
		return true;
	}

	// Stable permutation of [0, n) that lists the elements in order; nothing is moved.
	template <core::concepts::IndexLess LessT>
	std::vector<std::size_t> sorted_order(std::size_t n, const LessT& less) {
		std::vector<std::size_t> order(n);
		std::iota(order.begin(), order.end(), std::size_t{ 0 });
		if (n > 1) {
			std::stable_sort(order.begin(), order.end(),
				[&less](std::size_t i, std::size_t j) { return static_cast<bool>(less(i, j)); });
		}
		return order;
	}

} // namespace ordo::sort
