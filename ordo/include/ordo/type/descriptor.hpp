/*
 * File: descriptor.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ordo/core/bytes.hpp"
#include "ordo/core/errors.hpp"
#include "ordo/type/kind.hpp"

namespace ordo::type {

	using core::byte;

	class descriptor;
	using descriptor_ptr = std::shared_ptr<const descriptor>;

	using text_accessor = std::string_view(*)(const byte*);
	using identity_accessor = std::uintptr_t(*)(const byte*);

	struct sequence_accessor {
		std::size_t(*size)(const byte*) = nullptr;
		const byte* (*data)(const byte*) = nullptr;
	};

	struct field {
		std::string name;
		std::size_t offset = 0;
		descriptor_ptr type;
	};

	inline constexpr std::string_view discard_field_name = "_";

	// Runtime shape of a value: kind, byte size and, for composites, the
	// children with their offsets. Instances are immutable once built.
	class descriptor {
		struct key {
			explicit key() = default;
		};

	public:

		// Reachable only from the factories below.
		descriptor(key, kind k, std::string name, std::size_t size)
			: kind_(k)
			, name_(std::move(name))
			, size_(size)
		{}

		static descriptor_ptr numeric(kind k, std::string name) {
			if (!is_numeric(k)) {
				throw core::invalid_argument(std::format("kind {} is not numeric", kind_name(k)));
			}
			return std::make_shared<descriptor>(key{}, k, std::move(name), numeric_size(k));
		}

		static descriptor_ptr text(std::string name, std::size_t size, text_accessor access) {
			if (access == nullptr || size == 0) {
				throw core::invalid_argument(std::format("string type {} needs a size and an accessor", name));
			}
			auto res = std::make_shared<descriptor>(key{}, kind::string, std::move(name), size);
			res->text_ = access;
			return res;
		}

		static descriptor_ptr opaque(kind k, std::string name, std::size_t size, identity_accessor identity) {
			if (!is_opaque(k)) {
				throw core::invalid_argument(std::format("kind {} is not reference-like", kind_name(k)));
			}
			if (identity == nullptr || size == 0) {
				throw core::invalid_argument(std::format("reference type {} needs a size and an identity accessor", name));
			}
			auto res = std::make_shared<descriptor>(key{}, k, std::move(name), size);
			res->identity_ = identity;
			return res;
		}

		static descriptor_ptr array(descriptor_ptr element, std::size_t length) {
			if (!element) {
				throw core::invalid_argument("array element type is null");
			}
			auto name = std::format("{}[{}]", element->name(), length);
			auto res = std::make_shared<descriptor>(key{}, kind::array, std::move(name), element->size() * length);
			res->length_ = length;
			res->element_ = std::move(element);
			return res;
		}

		static descriptor_ptr record(std::string name, std::size_t size, std::vector<field> fields) {
			for (const auto& f : fields) {
				if (!f.type) {
					throw core::invalid_argument(std::format("field {}.{} has no type", name, f.name));
				}
				if (f.offset + f.type->size() > size) {
					throw core::invalid_argument(std::format("field {}.{} [{}, +{}) exceeds record size {}",
						name, f.name, f.offset, f.type->size(), size));
				}
			}
			auto res = std::make_shared<descriptor>(key{}, kind::record, std::move(name), size);
			res->fields_ = std::move(fields);
			return res;
		}

		static descriptor_ptr sequence(std::string name, std::size_t size, descriptor_ptr element, sequence_accessor access) {
			if (!element) {
				throw core::invalid_argument(std::format("sequence {} has no element type", name));
			}
			if (access.size == nullptr || access.data == nullptr) {
				throw core::invalid_argument(std::format("sequence {} needs size and data accessors", name));
			}
			auto res = std::make_shared<descriptor>(key{}, kind::sequence, std::move(name), size);
			res->element_ = std::move(element);
			res->sequence_ = access;
			return res;
		}

		static descriptor_ptr interface(std::string name, std::size_t size) {
			return std::make_shared<descriptor>(key{}, kind::interface, std::move(name), size);
		}

		kind get_kind() const noexcept { return kind_; }
		const std::string& name() const noexcept { return name_; }
		std::size_t size() const noexcept { return size_; }

		// array and sequence
		const descriptor_ptr& element() const noexcept { return element_; }
		// array only
		std::size_t length() const noexcept { return length_; }

		const std::vector<field>& fields() const noexcept { return fields_; }

		text_accessor text_access() const noexcept { return text_; }
		identity_accessor identity() const noexcept { return identity_; }
		const sequence_accessor& sequence_access() const noexcept { return sequence_; }

		// Same layout: kinds, sizes, names, offsets and accessors all match.
		bool equivalent(const descriptor& other) const {
			if (this == &other) {
				return true;
			}
			if (kind_ != other.kind_ || size_ != other.size_ || name_ != other.name_) {
				return false;
			}
			switch (kind_) {
			case kind::string:
				return text_ == other.text_;
			case kind::chan:
			case kind::func:
			case kind::map:
			case kind::pointer:
			case kind::unsafe_pointer:
				return identity_ == other.identity_;
			case kind::array:
				return length_ == other.length_ && element_->equivalent(*other.element_);
			case kind::sequence:
				return sequence_.size == other.sequence_.size
					&& sequence_.data == other.sequence_.data
					&& element_->equivalent(*other.element_);
			case kind::record: {
				if (fields_.size() != other.fields_.size()) {
					return false;
				}
				for (std::size_t i = 0; i < fields_.size(); ++i) {
					const auto& l = fields_[i];
					const auto& r = other.fields_[i];
					if (l.name != r.name || l.offset != r.offset || !l.type->equivalent(*r.type)) {
						return false;
					}
				}
				return true;
			}
			default:
				return true;
			}
		}

	private:

		kind kind_ = kind::invalid;
		std::string name_;
		std::size_t size_ = 0;
		std::size_t length_ = 0;
		descriptor_ptr element_;
		std::vector<field> fields_;
		text_accessor text_ = nullptr;
		identity_accessor identity_ = nullptr;
		sequence_accessor sequence_;
	};

} // namespace ordo::type
