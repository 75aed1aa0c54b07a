/*
 * File: less/debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <format>
#include <ostream>
#include <string>

#include "ordo/less/predicate.hpp"

namespace ordo::less {

	inline std::ostream& debug_print(std::ostream& os, const chain& c, int indent = 0) {
		auto pad = std::string(indent, ' ');
		const auto leaves = c.leaves();
		os << pad << std::format("chain: {} leaves={}\n", c.element_type()->name(), leaves.size());
		for (std::size_t i = 0; i < leaves.size(); ++i) {
			const auto& l = leaves[i];
			os << pad << std::format("  [{}] {} @{} {}\n", i, type::kind_name(l.kind), l.offset,
				l.path.empty() ? std::string("<element>") : l.path);
		}
		return os;
	}

} // namespace ordo::less
