/*
 * File: settings.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <string_view>
#include "ordo/type/descriptor.hpp"

namespace ordo::less {
    struct settings {
        std::string_view discard_name = type::discard_field_name;
        bool collect_leaves = true;
    };
    static_assert(!settings{}.discard_name.empty(), "discard name must not be empty");
}
