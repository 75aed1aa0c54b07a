/*
 * File: leaf.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cmath>
#include <concepts>
#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

#include "ordo/core/bytes.hpp"
#include "ordo/type/descriptor.hpp"

namespace ordo::less {

	using core::byte;

	// Orders two elements given their base addresses.
	using element_less = std::function<bool(const byte*, const byte*)>;

	namespace leaf {

		inline bool defer(const element_less& next, const byte* a, const byte* b) {
			return next ? next(a, b) : false;
		}

		inline element_less boolean(std::size_t off, element_less next) {
			return [off, next = std::move(next)](const byte* a, const byte* b) {
				const auto va = core::load_word<bool>(a + off);
				const auto vb = core::load_word<bool>(b + off);
				if (va == vb) {
					return defer(next, a, b);
				}
				return !va;
			};
		}

		template <std::integral WordT>
		element_less word(std::size_t off, element_less next) {
			return [off, next = std::move(next)](const byte* a, const byte* b) {
				const auto va = core::load_word<WordT>(a + off);
				const auto vb = core::load_word<WordT>(b + off);
				if (va == vb) {
					return defer(next, a, b);
				}
				return va < vb;
			};
		}

		// NaN sorts first; two NaNs tie.
		template <std::floating_point FloatT>
		element_less floating(std::size_t off, element_less next) {
			return [off, next = std::move(next)](const byte* a, const byte* b) {
				const auto va = core::load_word<FloatT>(a + off);
				const auto vb = core::load_word<FloatT>(b + off);
				const bool nan_a = std::isnan(va);
				const bool nan_b = std::isnan(vb);
				if (va == vb || (nan_a && nan_b)) {
					return defer(next, a, b);
				}
				return va < vb || (nan_a && !nan_b);
			};
		}

		template <std::floating_point FloatT>
		element_less complex(std::size_t off, element_less next) {
			return floating<FloatT>(off, floating<FloatT>(off + sizeof(FloatT), std::move(next)));
		}

		inline element_less text(std::size_t off, type::text_accessor access, element_less next) {
			return [off, access, next = std::move(next)](const byte* a, const byte* b) {
				const std::string_view va = access(a + off);
				const std::string_view vb = access(b + off);
				if (va == vb) {
					return defer(next, a, b);
				}
				return va < vb;
			};
		}

		inline element_less opaque(std::size_t off, type::identity_accessor identity, element_less next) {
			return [off, identity, next = std::move(next)](const byte* a, const byte* b) {
				const std::uintptr_t va = identity(a + off);
				const std::uintptr_t vb = identity(b + off);
				if (va == vb) {
					return defer(next, a, b);
				}
				return va < vb;
			};
		}

	} // namespace leaf

} // namespace ordo::less
