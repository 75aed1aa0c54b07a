/*
 * File: type/debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <format>
#include <ostream>
#include <string>

#include "ordo/type/descriptor.hpp"

namespace ordo::type {

	inline std::ostream& debug_print(std::ostream& os, const descriptor& t, int indent = 0) {
		auto pad = std::string(indent, ' ');

		switch (t.get_kind()) {
		case kind::array:
			os << pad << std::format("array: {} size={}\n", t.name(), t.size());
			debug_print(os, *t.element(), indent + 2);
			break;
		case kind::sequence:
			os << pad << std::format("sequence: {}\n", t.name());
			debug_print(os, *t.element(), indent + 2);
			break;
		case kind::record:
			os << pad << std::format("record: {} size={}\n", t.name(), t.size());
			for (const auto& f : t.fields()) {
				os << pad << std::format("  .{} @{}\n", f.name, f.offset);
				debug_print(os, *f.type, indent + 4);
			}
			break;
		default:
			os << pad << std::format("{}: {} size={}\n", kind_name(t.get_kind()), t.name(), t.size());
			break;
		}
		return os;
	}

} // namespace ordo::type
