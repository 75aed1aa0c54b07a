/*
 * File: kind.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string_view>

namespace ordo::type {

	enum class kind : std::uint16_t {
		invalid = 0,
		boolean = 1,
		i8 = 2,
		i16 = 3,
		i32 = 4,
		i64 = 5,
		ui8 = 6,
		ui16 = 7,
		ui32 = 8,
		ui64 = 9,
		uintptr = 10,
		fp32 = 11,
		fp64 = 12,
		complex64 = 13,
		complex128 = 14,
		string = 15,
		chan = 16,
		func = 17,
		map = 18,
		pointer = 19,
		unsafe_pointer = 20,
		array = 21,
		record = 22,
		interface = 23,
		sequence = 24,
	};

	constexpr std::string_view kind_name(kind k) noexcept {
		switch (k) {
		case kind::invalid: return "invalid";
		case kind::boolean: return "bool";
		case kind::i8: return "i8";
		case kind::i16: return "i16";
		case kind::i32: return "i32";
		case kind::i64: return "i64";
		case kind::ui8: return "ui8";
		case kind::ui16: return "ui16";
		case kind::ui32: return "ui32";
		case kind::ui64: return "ui64";
		case kind::uintptr: return "uintptr";
		case kind::fp32: return "fp32";
		case kind::fp64: return "fp64";
		case kind::complex64: return "complex64";
		case kind::complex128: return "complex128";
		case kind::string: return "string";
		case kind::chan: return "chan";
		case kind::func: return "func";
		case kind::map: return "map";
		case kind::pointer: return "pointer";
		case kind::unsafe_pointer: return "unsafe_pointer";
		case kind::array: return "array";
		case kind::record: return "record";
		case kind::interface: return "interface";
		case kind::sequence: return "sequence";
		}
		return "unknown";
	}

	// Fixed-width kinds whose value is the raw bytes at the leaf offset.
	constexpr bool is_numeric(kind k) noexcept {
		switch (k) {
		case kind::boolean:
		case kind::i8: case kind::i16: case kind::i32: case kind::i64:
		case kind::ui8: case kind::ui16: case kind::ui32: case kind::ui64:
		case kind::uintptr:
		case kind::fp32: case kind::fp64:
		case kind::complex64: case kind::complex128:
			return true;
		default:
			return false;
		}
	}

	constexpr bool is_opaque(kind k) noexcept {
		switch (k) {
		case kind::chan:
		case kind::func:
		case kind::map:
		case kind::pointer:
		case kind::unsafe_pointer:
			return true;
		default:
			return false;
		}
	}

	constexpr std::size_t numeric_size(kind k) noexcept {
		switch (k) {
		case kind::boolean: return sizeof(bool);
		case kind::i8: case kind::ui8: return 1;
		case kind::i16: case kind::ui16: return 2;
		case kind::i32: case kind::ui32: case kind::fp32: return 4;
		case kind::i64: case kind::ui64: case kind::fp64: case kind::complex64: return 8;
		case kind::uintptr: return sizeof(std::uintptr_t);
		case kind::complex128: return 16;
		default: return 0;
		}
	}

} // namespace ordo::type
