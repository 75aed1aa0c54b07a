/*
 * File: describe.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <any>
#include <array>
#include <complex>
#include <concepts>
#include <format>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "ordo/core/bytes.hpp"
#include "ordo/type/descriptor.hpp"

namespace ordo::type {

	// Specialize for every type whose values need a runtime shape:
	//   template <> struct describe<my_type> { static descriptor_ptr get(); };
	template <typename T>
	struct describe;

	template <typename T>
	concept Described = requires {
		{ describe<std::remove_cv_t<T>>::get() } -> std::convertible_to<descriptor_ptr>;
	};

	// One descriptor per concrete type, built on first use.
	template <Described T>
	const descriptor_ptr& type_of() {
		static const descriptor_ptr value = describe<std::remove_cv_t<T>>::get();
		return value;
	}

	namespace detail {

		template <typename T>
		constexpr kind integer_kind() noexcept {
			constexpr bool is_signed = std::is_signed_v<T>;
			if constexpr (sizeof(T) == 1) {
				return is_signed ? kind::i8 : kind::ui8;
			}
			else if constexpr (sizeof(T) == 2) {
				return is_signed ? kind::i16 : kind::ui16;
			}
			else if constexpr (sizeof(T) == 4) {
				return is_signed ? kind::i32 : kind::ui32;
			}
			else {
				static_assert(sizeof(T) == 8, "Unsupported integer size");
				return is_signed ? kind::i64 : kind::ui64;
			}
		}

		template <typename T>
		struct is_mapping : std::false_type {};
		template <typename K, typename V, typename C, typename A>
		struct is_mapping<std::map<K, V, C, A>> : std::true_type {};
		template <typename K, typename V, typename H, typename E, typename A>
		struct is_mapping<std::unordered_map<K, V, H, E, A>> : std::true_type {};

		template <typename T>
		constexpr kind handle_kind() noexcept {
			return is_mapping<std::remove_cv_t<T>>::value ? kind::map : kind::pointer;
		}

		template <typename PtrT>
		std::uintptr_t pointer_identity(const core::byte* where) {
			return reinterpret_cast<std::uintptr_t>(core::load_word<PtrT>(where));
		}

		template <typename SmartT>
		std::uintptr_t smart_identity(const core::byte* where) {
			return reinterpret_cast<std::uintptr_t>(reinterpret_cast<const SmartT*>(where)->get());
		}

		template <typename StrT>
		std::string_view text_view(const core::byte* where) {
			return std::string_view(*reinterpret_cast<const StrT*>(where));
		}

		template <typename SeqT>
		std::size_t sequence_size(const core::byte* where) {
			return reinterpret_cast<const SeqT*>(where)->size();
		}

		template <typename SeqT>
		const core::byte* sequence_data(const core::byte* where) {
			return core::as_bytes_ptr(reinterpret_cast<const SeqT*>(where)->data());
		}

		template <typename SeqT, typename ElemT>
		descriptor_ptr make_sequence(std::string_view family) {
			const auto& elem = type_of<ElemT>();
			return descriptor::sequence(std::format("{}<{}>", family, elem->name()), sizeof(SeqT), elem,
				sequence_accessor{ &sequence_size<SeqT>, &sequence_data<SeqT> });
		}
	}

	template <>
	struct describe<bool> {
		static descriptor_ptr get() { return descriptor::numeric(kind::boolean, "bool"); }
	};

	template <std::integral T>
	struct describe<T> {
		static descriptor_ptr get() {
			constexpr auto k = detail::integer_kind<T>();
			return descriptor::numeric(k, std::string(kind_name(k)));
		}
	};

	template <>
	struct describe<float> {
		static_assert(sizeof(float) == 4, "float must be 32-bit");
		static descriptor_ptr get() { return descriptor::numeric(kind::fp32, "fp32"); }
	};

	template <>
	struct describe<double> {
		static_assert(sizeof(double) == 8, "double must be 64-bit");
		static descriptor_ptr get() { return descriptor::numeric(kind::fp64, "fp64"); }
	};

	template <>
	struct describe<std::complex<float>> {
		static descriptor_ptr get() { return descriptor::numeric(kind::complex64, "complex64"); }
	};

	template <>
	struct describe<std::complex<double>> {
		static descriptor_ptr get() { return descriptor::numeric(kind::complex128, "complex128"); }
	};

	template <>
	struct describe<std::string> {
		static descriptor_ptr get() {
			return descriptor::text("string", sizeof(std::string), &detail::text_view<std::string>);
		}
	};

	template <>
	struct describe<std::string_view> {
		static descriptor_ptr get() {
			return descriptor::text("string_view", sizeof(std::string_view), &detail::text_view<std::string_view>);
		}
	};

	template <typename T>
		requires (!std::is_void_v<T> && !std::is_function_v<T>)
	struct describe<T*> {
		static descriptor_ptr get() {
			constexpr auto k = detail::handle_kind<T>();
			return descriptor::opaque(k, std::format("{}*", kind_name(k)), sizeof(T*), &detail::pointer_identity<T*>);
		}
	};

	template <typename T>
		requires std::is_void_v<T>
	struct describe<T*> {
		static descriptor_ptr get() {
			return descriptor::opaque(kind::unsafe_pointer, "void*", sizeof(T*), &detail::pointer_identity<T*>);
		}
	};

	template <typename T>
		requires std::is_function_v<T>
	struct describe<T*> {
		static descriptor_ptr get() {
			return descriptor::opaque(kind::func, "func", sizeof(T*), &detail::pointer_identity<T*>);
		}
	};

	template <typename T>
	struct describe<std::shared_ptr<T>> {
		static descriptor_ptr get() {
			using ptr_type = std::shared_ptr<T>;
			constexpr auto k = detail::handle_kind<T>();
			return descriptor::opaque(k, std::format("shared_ptr<{}>", kind_name(k)), sizeof(ptr_type),
				&detail::smart_identity<ptr_type>);
		}
	};

	template <typename T, typename D>
	struct describe<std::unique_ptr<T, D>> {
		static descriptor_ptr get() {
			using ptr_type = std::unique_ptr<T, D>;
			constexpr auto k = detail::handle_kind<T>();
			return descriptor::opaque(k, std::format("unique_ptr<{}>", kind_name(k)), sizeof(ptr_type),
				&detail::smart_identity<ptr_type>);
		}
	};

	template <typename T, std::size_t N>
	struct describe<std::array<T, N>> {
		static_assert(sizeof(std::array<T, N>) == sizeof(T) * N, "std::array must be tightly packed");
		static descriptor_ptr get() { return descriptor::array(type_of<T>(), N); }
	};

	template <typename T, std::size_t N>
	struct describe<T[N]> {
		static descriptor_ptr get() { return descriptor::array(type_of<T>(), N); }
	};

	template <typename T, typename A>
		requires (!std::same_as<T, bool>)
	struct describe<std::vector<T, A>> {
		static descriptor_ptr get() { return detail::make_sequence<std::vector<T, A>, T>("vector"); }
	};

	template <typename T, std::size_t E>
	struct describe<std::span<T, E>> {
		static descriptor_ptr get() { return detail::make_sequence<std::span<T, E>, T>("span"); }
	};

	template <>
	struct describe<std::any> {
		static descriptor_ptr get() { return descriptor::interface("any", sizeof(std::any)); }
	};

} // namespace ordo::type
