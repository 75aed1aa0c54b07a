/*
 * File: predicate.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <format>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "ordo/core/assert.hpp"
#include "ordo/core/bytes.hpp"
#include "ordo/core/errors.hpp"
#include "ordo/less/leaf.hpp"
#include "ordo/less/sequence.hpp"
#include "ordo/type/descriptor.hpp"
#include "ordo/type/value_ref.hpp"

namespace ordo::less {

	struct leaf_path {
		type::kind kind = type::kind::invalid;
		std::size_t offset = 0;
		std::string path;
	};

	class predicate;
	class builder;

	// Compiled comparison for one element type. Independent of any storage.
	// Always owned by a shared_ptr: only builder can make one.
	class chain : public std::enable_shared_from_this<chain> {
		friend class builder;

		struct key {
			explicit key() = default;
		};

	public:

		chain(key, type::descriptor_ptr element, element_less less, std::vector<leaf_path> leaves)
			: element_(std::move(element))
			, less_(std::move(less))
			, leaves_(std::move(leaves))
		{}

		const type::descriptor_ptr& element_type() const noexcept { return element_; }
		std::span<const leaf_path> leaves() const noexcept { return leaves_; }

		bool compare(const core::byte* a, const core::byte* b) const {
			return leaf::defer(less_, a, b);
		}

		predicate bind(const core::byte* base, std::size_t count) const;

	private:
		type::descriptor_ptr element_;
		element_less less_;
		std::vector<leaf_path> leaves_;
	};

	// less(i, j) over the elements of one collection.
	class predicate {
	public:

		predicate() = default;

		predicate(std::shared_ptr<const chain> c, const core::byte* base, std::size_t count)
			: chain_(std::move(c))
			, base_(base)
			, count_(count)
			, stride_(chain_ ? chain_->element_type()->size() : 0)
		{}

		bool operator()(std::size_t i, std::size_t j) const {
			ORDO_ASSERT(count_ != 0, "empty predicate must not be invoked");
			ORDO_ASSERT(i < count_ && j < count_, "index out of range");
			if (count_ == 0) {
				return false;
			}
			return chain_->compare(base_ + stride_ * i, base_ + stride_ * j);
		}

		explicit operator bool() const noexcept { return count_ != 0; }

		std::size_t size() const noexcept { return count_; }

		const std::shared_ptr<const chain>& get_chain() const noexcept { return chain_; }

		std::span<const leaf_path> leaves() const noexcept {
			if (chain_) {
				return chain_->leaves();
			}
			return {};
		}

		// Points the compiled chain at another collection of the same element layout.
		void rebind(const type::value_ref& collection) {
			if (!chain_) {
				throw core::invalid_argument("cannot rebind a predicate without a chain");
			}
			auto seq = sequence_of(collection);
			if (!seq.element->equivalent(*chain_->element_type())) {
				throw core::invalid_argument(std::format("element type {} does not match {}",
					seq.element->name(), chain_->element_type()->name()));
			}
			base_ = seq.data;
			count_ = seq.count;
		}

	private:
		std::shared_ptr<const chain> chain_;
		const core::byte* base_ = nullptr;
		std::size_t count_ = 0;
		std::size_t stride_ = 0;
	};

	inline predicate chain::bind(const core::byte* base, std::size_t count) const {
		return predicate(shared_from_this(), count == 0 ? nullptr : base, count);
	}

} // namespace ordo::less
