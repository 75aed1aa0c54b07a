/*
 * File: sequence.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <format>

#include "ordo/core/bytes.hpp"
#include "ordo/core/errors.hpp"
#include "ordo/type/value_ref.hpp"

namespace ordo::less {

	struct sequence_view {
		const core::byte* data = nullptr;
		std::size_t count = 0;
		type::descriptor_ptr element;
	};

	// Elements of a sequence or fixed-size array value; anything else is rejected.
	inline sequence_view sequence_of(const type::value_ref& collection) {
		const auto& t = *collection.type();
		switch (t.get_kind()) {
		case type::kind::sequence: {
			const auto& access = t.sequence_access();
			const auto count = access.size(collection.address());
			return { count == 0 ? nullptr : access.data(collection.address()), count, t.element() };
		}
		case type::kind::array:
			return { collection.address(), t.length(), t.element() };
		default:
			break;
		}
		throw core::invalid_argument(std::format("argument of type {} (kind {}) is not a sequence",
			t.name(), type::kind_name(t.get_kind())));
	}

} // namespace ordo::less
