/*
 * File: record.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "ordo/core/bytes.hpp"
#include "ordo/type/describe.hpp"

namespace ordo::type {

	namespace detail {

		// One uninitialized T-sized slot per record type. No T is ever
		// constructed in it; only member addresses are taken.
		template <typename T>
		struct layout_slot {
			union storage {
				storage() {}
				~storage() {}
				char pad;
				T obj;
			};

			static const T& object() noexcept {
				static storage slot;
				return slot.obj;
			}
		};

		// Offset of a data member. T must be standard-layout for the result to
		// be meaningful: no virtual bases, members laid out in one class.
		template <typename T, typename M>
		std::size_t member_offset(M T::* member) noexcept {
			const T& obj = layout_slot<T>::object();
			const auto* base = reinterpret_cast<const core::byte*>(std::addressof(obj));
			const auto* at = reinterpret_cast<const core::byte*>(std::addressof(obj.*member));
			return static_cast<std::size_t>(at - base);
		}
	}

	/*
	 * Collects the fields of a record type in declaration order:
	 *
	 *   template <> struct describe<point> {
	 *       static descriptor_ptr get() {
	 *           return record_builder<point>("point")
	 *               .field("x", &point::x)
	 *               .discard(&point::reserved)
	 *               .field("y", &point::y)
	 *               .build();
	 *       }
	 *   };
	 */
	template <typename T>
	class record_builder {
	public:

		explicit record_builder(std::string name)
			: name_(std::move(name))
		{}

		template <Described M>
		record_builder& field(std::string name, M T::* member) {
			return field(std::move(name), detail::member_offset(member), type_of<M>());
		}

		record_builder& field(std::string name, std::size_t offset, descriptor_ptr type) {
			fields_.push_back({ std::move(name), offset, std::move(type) });
			return *this;
		}

		// Placeholder member: keeps its slot in the layout, never compared.
		template <Described M>
		record_builder& discard(M T::* member) {
			return field(std::string(discard_field_name), member);
		}

		descriptor_ptr build() const {
			return descriptor::record(name_, sizeof(T), fields_);
		}

	private:
		std::string name_;
		std::vector<type::field> fields_;
	};

} // namespace ordo::type
