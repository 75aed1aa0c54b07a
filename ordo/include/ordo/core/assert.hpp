/*
 * File: assert.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdio>
#include <cstdlib>

namespace ordo::core::detail {

	[[noreturn]] inline void assertion_failed(const char* cond, const char* msg, const char* file, int line) noexcept {
		std::fprintf(stderr, "%s:%d: ordo invariant '%s' broken: %s\n", file, line, cond, msg);
		std::abort();
	}

} // namespace ordo::core::detail

// Internal invariants only; compiled out with NDEBUG. Define ORDO_ASSERT
// before including any ordo header to route failures elsewhere.
#ifndef ORDO_ASSERT
#	ifdef NDEBUG
#		define ORDO_ASSERT(cond, msg) static_cast<void>(0)
#	else
#		define ORDO_ASSERT(cond, msg) \
			((cond) ? static_cast<void>(0) : ::ordo::core::detail::assertion_failed(#cond, msg, __FILE__, __LINE__))
#	endif
#endif
