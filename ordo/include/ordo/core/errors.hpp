/*
 * File: errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ordo::core {

	class invalid_argument : public std::invalid_argument {
	public:
		using std::invalid_argument::invalid_argument;
	};

	// Raised when a reachable leaf of an element type cannot be ordered.
	class unsupported_type : public std::logic_error {
	public:
		unsupported_type(std::string type_name, std::string_view kind_name, std::string path)
			: std::logic_error(std::format("un-sortable type {} (kind {}){}", type_name, kind_name,
				path.empty() ? std::string{} : std::format(" at '{}'", path)))
			, type_name_(std::move(type_name))
			, kind_name_(kind_name)
			, path_(std::move(path))
		{}

		const std::string& type_name() const noexcept { return type_name_; }
		std::string_view kind_name() const noexcept { return kind_name_; }
		const std::string& path() const noexcept { return path_; }

	private:
		std::string type_name_;
		std::string_view kind_name_;
		std::string path_;
	};

} // namespace ordo::core
