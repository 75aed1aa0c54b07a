/*
 * File: value_ref.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <memory>
#include <utility>

#include "ordo/core/bytes.hpp"
#include "ordo/core/errors.hpp"
#include "ordo/type/describe.hpp"

namespace ordo::type {

	// Type-erased reference to a live value: its address and its shape.
	class value_ref {
	public:
		value_ref(const void* address, descriptor_ptr type)
			: address_(static_cast<const core::byte*>(address))
			, type_(std::move(type))
		{
			if (address_ == nullptr || !type_) {
				throw core::invalid_argument("value reference needs an address and a type");
			}
		}

		const core::byte* address() const noexcept { return address_; }
		const descriptor_ptr& type() const noexcept { return type_; }

	private:
		const core::byte* address_ = nullptr;
		descriptor_ptr type_;
	};

	template <Described T>
	value_ref ref(const T& value) {
		return value_ref(std::addressof(value), type_of<T>());
	}

} // namespace ordo::type
