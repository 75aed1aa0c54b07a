/*
 * File: builder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include "ordo/core/errors.hpp"
#include "ordo/less/leaf.hpp"
#include "ordo/less/predicate.hpp"
#include "ordo/less/sequence.hpp"
#include "ordo/less/settings.hpp"
#include "ordo/type/describe.hpp"
#include "ordo/type/value_ref.hpp"

namespace ordo::less {

	/*
	 * Turns an element type into a chain of leaf comparators.
	 *
	 * Leaves are built from the last one to the first, each one getting the
	 * previously built comparator as its "on equal" continuation. At runtime
	 * the first declared field (or array index 0) decides first.
	 */
	class builder {
	public:

		builder() = default;
		explicit builder(settings s) : settings_(s) {}

		std::shared_ptr<const chain> compile(const type::descriptor_ptr& element) const {
			if (!element) {
				throw core::invalid_argument("element type is null");
			}
			std::vector<leaf_path> leaves;
			auto* sink = settings_.collect_leaves ? &leaves : nullptr;
			auto less = resolve(0, *element, nullptr, std::string{}, sink);
			std::reverse(leaves.begin(), leaves.end());
			return std::make_shared<chain>(chain::key{}, element, std::move(less), std::move(leaves));
		}

		predicate of(const type::value_ref& collection) const {
			auto seq = sequence_of(collection);
			return compile(seq.element)->bind(seq.data, seq.count);
		}

	private:

		static std::string join(const std::string& path, std::string_view name) {
			if (path.empty()) {
				return std::string(name);
			}
			return std::format("{}.{}", path, name);
		}

		static void add_leaf(std::vector<leaf_path>* sink, type::kind k, std::size_t off, std::string path) {
			if (sink) {
				sink->push_back({ k, off, std::move(path) });
			}
		}

		template <typename WordT>
		static element_less word(std::vector<leaf_path>* sink, type::kind k, std::size_t off,
			const std::string& path, element_less next)
		{
			add_leaf(sink, k, off, path);
			return leaf::word<WordT>(off, std::move(next));
		}

		template <typename FloatT>
		static element_less floating(std::vector<leaf_path>* sink, type::kind k, std::size_t off,
			const std::string& path, element_less next)
		{
			add_leaf(sink, k, off, path);
			return leaf::floating<FloatT>(off, std::move(next));
		}

		// Sink order is reversed at the end, so the imaginary part goes in first.
		template <typename FloatT>
		static element_less complex(std::vector<leaf_path>* sink, type::kind part, std::size_t off,
			const std::string& path, element_less next)
		{
			add_leaf(sink, part, off + sizeof(FloatT), join(path, "imag"));
			add_leaf(sink, part, off, join(path, "real"));
			return leaf::complex<FloatT>(off, std::move(next));
		}

		element_less resolve(std::size_t off, const type::descriptor& t, element_less next,
			const std::string& path, std::vector<leaf_path>* sink) const
		{
			using type::kind;

			const auto k = t.get_kind();
			switch (k) {
			case kind::boolean:
				add_leaf(sink, k, off, path);
				return leaf::boolean(off, std::move(next));
			case kind::i8:
				return word<std::int8_t>(sink, k, off, path, std::move(next));
			case kind::i16:
				return word<std::int16_t>(sink, k, off, path, std::move(next));
			case kind::i32:
				return word<std::int32_t>(sink, k, off, path, std::move(next));
			case kind::i64:
				return word<std::int64_t>(sink, k, off, path, std::move(next));
			case kind::ui8:
				return word<std::uint8_t>(sink, k, off, path, std::move(next));
			case kind::ui16:
				return word<std::uint16_t>(sink, k, off, path, std::move(next));
			case kind::ui32:
				return word<std::uint32_t>(sink, k, off, path, std::move(next));
			case kind::ui64:
				return word<std::uint64_t>(sink, k, off, path, std::move(next));
			case kind::uintptr:
				return word<std::uintptr_t>(sink, k, off, path, std::move(next));
			case kind::fp32:
				return floating<float>(sink, k, off, path, std::move(next));
			case kind::fp64:
				return floating<double>(sink, k, off, path, std::move(next));
			case kind::complex64:
				return complex<float>(sink, kind::fp32, off, path, std::move(next));
			case kind::complex128:
				return complex<double>(sink, kind::fp64, off, path, std::move(next));
			case kind::string:
				add_leaf(sink, k, off, path);
				return leaf::text(off, t.text_access(), std::move(next));
			case kind::chan:
			case kind::func:
			case kind::map:
			case kind::pointer:
			case kind::unsafe_pointer:
				add_leaf(sink, k, off, path);
				return leaf::opaque(off, t.identity(), std::move(next));
			case kind::array: {
				auto res = std::move(next);
				const auto& elem = *t.element();
				for (std::size_t i = t.length(); i-- > 0;) {
					res = resolve(off + elem.size() * i, elem, std::move(res), std::format("{}[{}]", path, i), sink);
				}
				return res;
			}
			case kind::record: {
				// Walk fields from the back, building up the tie-breaker chain in reverse.
				auto res = std::move(next);
				const auto& fields = t.fields();
				for (auto it = fields.rbegin(); it != fields.rend(); ++it) {
					if (it->name == settings_.discard_name) {
						continue;
					}
					res = resolve(off + it->offset, *it->type, std::move(res), join(path, it->name), sink);
				}
				return res;
			}
			case kind::interface:
			case kind::sequence:
			case kind::invalid:
				break;
			}
			throw core::unsupported_type(t.name(), type::kind_name(k), path);
		}

		settings settings_;
	};

	inline std::shared_ptr<const chain> compile(const type::descriptor_ptr& element, const settings& s = {}) {
		return builder(s).compile(element);
	}

	inline predicate of(const type::value_ref& collection, const settings& s = {}) {
		return builder(s).of(collection);
	}

	// Any described value; only sequences and fixed-size arrays are accepted at runtime.
	template <type::Described T>
	predicate of(const T& collection, const settings& s = {}) {
		return of(type::ref(collection), s);
	}

} // namespace ordo::less
