// tests/test_builder.cpp
#include "tests.hpp"

#include "ordo/less/builder.hpp"
#include "ordo/less/debug.hpp"
#include "ordo/sort/slice.hpp"
#include "ordo/type/record.hpp"

#include <algorithm>
#include <any>
#include <array>
#include <cmath>
#include <complex>
#include <cstddef>
#include <limits>
#include <memory>
#include <random>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <vector>

namespace {

	struct string_int {
		std::string s;
		int i;
		bool operator == (const string_int&) const = default;
	};

	struct blank {
		std::int32_t a;
		std::int32_t reserved;
		std::int32_t b;
	};

	struct measured {
		double x;
		std::int32_t y;
	};

	struct segment {
		std::string name;
		std::array<std::int16_t, 2> pos;
		std::complex<double> z;
		std::int32_t pad;
		bool flag;
	};

	struct with_list {
		int id;
		std::vector<int> items;
	};

	struct padded {
		std::int32_t a;
		std::int32_t pad;
		std::int32_t b;
	};

#pragma pack(push, 1)
	struct packed_row {
		std::uint8_t tag;
		std::int32_t id;
		double weight;
	};
#pragma pack(pop)

	static_assert(sizeof(packed_row) == 13, "packed_row must have no padding");

	template <typename T>
	void sort_all(std::vector<T>& v) {
		ordo::sort::sort_slice(v, ordo::less::of(v));
	}
}

namespace ordo::type {

	template <>
	struct describe<string_int> {
		static descriptor_ptr get() {
			return record_builder<string_int>("string_int")
				.field("s", &string_int::s)
				.field("i", &string_int::i)
				.build();
		}
	};

	template <>
	struct describe<blank> {
		static descriptor_ptr get() {
			return record_builder<blank>("blank")
				.field("a", &blank::a)
				.discard(&blank::reserved)
				.field("b", &blank::b)
				.build();
		}
	};

	template <>
	struct describe<measured> {
		static descriptor_ptr get() {
			return record_builder<measured>("measured")
				.field("x", &measured::x)
				.field("y", &measured::y)
				.build();
		}
	};

	template <>
	struct describe<segment> {
		static descriptor_ptr get() {
			return record_builder<segment>("segment")
				.field("name", &segment::name)
				.field("pos", &segment::pos)
				.field("z", &segment::z)
				.discard(&segment::pad)
				.field("flag", &segment::flag)
				.build();
		}
	};

	template <>
	struct describe<with_list> {
		static descriptor_ptr get() {
			return record_builder<with_list>("with_list")
				.field("id", &with_list::id)
				.field("items", &with_list::items)
				.build();
		}
	};

	template <>
	struct describe<padded> {
		static descriptor_ptr get() {
			return record_builder<padded>("padded")
				.field("a", &padded::a)
				.field("pad", &padded::pad)
				.field("b", &padded::b)
				.build();
		}
	};

	template <>
	struct describe<packed_row> {
		static descriptor_ptr get() {
			return record_builder<packed_row>("packed_row")
				.field("tag", offsetof(packed_row, tag), type_of<std::uint8_t>())
				.field("id", offsetof(packed_row, id), type_of<std::int32_t>())
				.field("weight", offsetof(packed_row, weight), type_of<double>())
				.build();
		}
	};
}

using namespace ordo;

TEST_SUITE("less: builder") {

	TEST_CASE("of: sorts the basic shapes") {

		SUBCASE("int") {
			std::vector<int> v{ 2, 4, 1, 3, 0, -1, 5 };
			sort_all(v);
			CHECK(v == std::vector<int>{ -1, 0, 1, 2, 3, 4, 5 });
		}

		SUBCASE("string") {
			std::vector<std::string> v{ "foo", "quux", "baz", "bar" };
			sort_all(v);
			CHECK(v == std::vector<std::string>{ "bar", "baz", "foo", "quux" });
		}

		SUBCASE("struct") {
			std::vector<string_int> v{ { "a", 2 }, { "b", 2 }, { "b", 1 }, { "a", 1 } };
			sort_all(v);
			CHECK(v == std::vector<string_int>{ { "a", 1 }, { "a", 2 }, { "b", 1 }, { "b", 2 } });
		}

		SUBCASE("bool") {
			bool v[] = { false, true, false, false, true };
			ordo::sort::sort_slice(std::span<bool>(v), less::of(v));
			CHECK(std::ranges::equal(v, std::array<bool, 5>{ false, false, false, true, true }));
		}

		SUBCASE("complex64") {
			using c64 = std::complex<float>;
			std::vector<c64> v{ { 1, 2 }, { 2, 1 }, { 1, 1 }, { 2, 2 } };
			sort_all(v);
			CHECK(v == std::vector<c64>{ { 1, 1 }, { 1, 2 }, { 2, 1 }, { 2, 2 } });
		}

		SUBCASE("complex128") {
			using c128 = std::complex<double>;
			std::vector<c128> v{ { 1, 2 }, { 2, 1 }, { 1, 1 }, { 2, 2 } };
			sort_all(v);
			CHECK(v == std::vector<c128>{ { 1, 1 }, { 1, 2 }, { 2, 1 }, { 2, 2 } });
		}

		SUBCASE("array") {
			using row = std::array<int, 3>;
			std::vector<row> v{ { 3, 2, 1 }, { 2, 3, 1 }, { 1, 3, 2 }, { 1, 1, 2 }, { 1, 1, 1 } };
			sort_all(v);
			CHECK(v == std::vector<row>{ { 1, 1, 1 }, { 1, 1, 2 }, { 1, 3, 2 }, { 2, 3, 1 }, { 3, 2, 1 } });
		}

		SUBCASE("mixed integer widths") {
			std::vector<std::int8_t> i8{ 5, -128, 127, 0, -1 };
			sort_all(i8);
			CHECK(i8 == std::vector<std::int8_t>{ -128, -1, 0, 5, 127 });

			std::vector<std::uint64_t> u64{ std::numeric_limits<std::uint64_t>::max(), 0, 42 };
			sort_all(u64);
			CHECK(u64 == std::vector<std::uint64_t>{ 0, 42, std::numeric_limits<std::uint64_t>::max() });
		}
	}

	TEST_CASE("of: tie-break falls to the next field") {
		std::vector<string_int> v{ { "x", 2 }, { "x", 1 } };
		auto lt = less::of(v);
		CHECK(lt(1, 0));
		CHECK_FALSE(lt(0, 1));
		ordo::sort::sort_slice(v, lt);
		CHECK(v == std::vector<string_int>{ { "x", 1 }, { "x", 2 } });
	}

	TEST_CASE("of: discard fields are ignored") {
		std::vector<blank> v{ { 1, 0, 2 }, { 1, 99, 2 } };
		auto lt = less::of(v);
		CHECK_FALSE(lt(0, 1));
		CHECK_FALSE(lt(1, 0));

		SUBCASE("ordering is decided by the remaining fields") {
			std::vector<blank> w{ { 1, 0, 5 }, { 1, 99, 2 } };
			auto wl = less::of(w);
			CHECK_FALSE(wl(0, 1));
			CHECK(wl(1, 0));
		}

		SUBCASE("same leaves as the record without the placeholder") {
			std::vector<type::field> fields{
				{ "a", offsetof(blank, a), type::type_of<std::int32_t>() },
				{ "b", offsetof(blank, b), type::type_of<std::int32_t>() },
			};
			auto without = type::descriptor::record("blank", sizeof(blank), fields);
			const auto with_leaves = lt.leaves();
			const auto without_leaves = less::compile(without)->leaves();
			REQUIRE(with_leaves.size() == without_leaves.size());
			for (std::size_t i = 0; i < with_leaves.size(); ++i) {
				CHECK(with_leaves[i].offset == without_leaves[i].offset);
				CHECK(with_leaves[i].path == without_leaves[i].path);
			}
		}
	}

	TEST_CASE("of: custom discard name") {
		std::vector<padded> v{ { 1, 7, 3 }, { 1, 0, 3 } };

		auto by_default = less::of(v);
		CHECK(by_default.leaves().size() == 3);
		CHECK(by_default(1, 0));

		auto by_pad = less::of(v, less::settings{ .discard_name = "pad" });
		CHECK(by_pad.leaves().size() == 2);
		CHECK_FALSE(by_pad(1, 0));
		CHECK_FALSE(by_pad(0, 1));
	}

	TEST_CASE("of: NaN sorts first and ties defer") {
		const double nan = std::numeric_limits<double>::quiet_NaN();

		SUBCASE("plain values") {
			std::vector<double> v{ 1.0, nan, -1.0 };
			sort_all(v);
			CHECK(std::isnan(v[0]));
			CHECK(v[1] == -1.0);
			CHECK(v[2] == 1.0);
		}

		SUBCASE("inside a record") {
			std::vector<measured> v{ { nan, 2 }, { nan, 1 }, { 0.5, 0 } };
			auto lt = less::of(v);
			CHECK(lt(1, 0));
			CHECK_FALSE(lt(0, 1));
			CHECK(lt(0, 2));
			ordo::sort::sort_slice(v, lt);
			CHECK(std::isnan(v[0].x));
			CHECK(v[0].y == 1);
			CHECK(std::isnan(v[1].x));
			CHECK(v[1].y == 2);
			CHECK(v[2].x == 0.5);
		}
	}

	TEST_CASE("of: empty collection gives an empty predicate") {
		std::vector<string_int> v;
		auto lt = less::of(v);
		CHECK_FALSE(static_cast<bool>(lt));
		CHECK(lt.size() == 0);
		CHECK(lt.leaves().size() == 2);
		ordo::sort::sort_slice(v, lt);
		CHECK(v.empty());

		std::vector<std::any> open;
		CHECK_THROWS_AS(less::of(open), core::unsupported_type);
	}

	TEST_CASE("of: rejects what cannot be ordered") {

		SUBCASE("not a sequence") {
			int value = 5;
			CHECK_THROWS_AS(less::of(value), core::invalid_argument);
			string_int rec{ "a", 1 };
			CHECK_THROWS_AS(less::of(rec), core::invalid_argument);
			std::string text = "abc";
			CHECK_THROWS_AS(less::of(text), core::invalid_argument);
		}

		SUBCASE("open values") {
			std::vector<std::any> v{ std::any(1), std::any(2) };
			CHECK_THROWS_AS(less::of(v), core::unsupported_type);
		}

		SUBCASE("nested sequences") {
			std::vector<std::vector<int>> v{ { 1 }, { 0 } };
			CHECK_THROWS_AS(less::of(v), core::unsupported_type);
		}

		SUBCASE("sequence inside a record") {
			std::vector<with_list> v{ { 1, { 1 } } };
			try {
				less::of(v);
				FAIL("expected unsupported_type");
			}
			catch (const core::unsupported_type& e) {
				CHECK(e.path() == "items");
				CHECK(e.kind_name() == "sequence");
				CHECK(e.type_name() == "vector<i32>");
			}
		}
	}

	TEST_CASE("of: fixed-size arrays are sequences too") {
		std::array<string_int, 3> v{ { { "b", 1 }, { "a", 9 }, { "a", 3 } } };
		auto lt = less::of(v);
		CHECK(lt.size() == 3);
		ordo::sort::sort_slice(std::span<string_int>(v), lt);
		CHECK(v[0] == string_int{ "a", 3 });
		CHECK(v[1] == string_int{ "a", 9 });
		CHECK(v[2] == string_int{ "b", 1 });
	}

	TEST_CASE("of: spans over existing storage") {
		std::vector<string_int> v{ { "b", 2 }, { "a", 7 }, { "b", 1 }, { "a", 3 } };
		const std::vector<string_int> expected{ { "a", 3 }, { "a", 7 }, { "b", 1 }, { "b", 2 } };

		SUBCASE("temporary span") {
			auto lt = less::of(std::span<string_int>(v));
			REQUIRE(lt.size() == 4);
			ordo::sort::sort_slice(v, lt);
			CHECK(v == expected);
		}

		SUBCASE("read-only span") {
			const std::span<const string_int> view(v);
			auto lt = less::of(view);
			REQUIRE(lt.size() == 4);
			ordo::sort::sort_slice(v, lt);
			CHECK(v == expected);
		}

		SUBCASE("part of a collection") {
			auto lt = less::of(std::span<string_int>(v).subspan(2, 2));
			REQUIRE(lt.size() == 2);
			CHECK_FALSE(lt(0, 1));
			CHECK(lt(1, 0));
			ordo::sort::sort_slice(std::span<string_int>(v).subspan(2, 2), lt);
			CHECK(v[0] == string_int{ "b", 2 });
			CHECK(v[1] == string_int{ "a", 7 });
			CHECK(v[2] == string_int{ "a", 3 });
			CHECK(v[3] == string_int{ "b", 1 });
		}

		SUBCASE("empty span") {
			auto lt = less::of(std::span<string_int>());
			CHECK_FALSE(lt);
			CHECK(lt.leaves().size() == 2);
		}
	}

	TEST_CASE("of: string_view elements") {
		const std::string storage = "pear apple fig apple";
		std::vector<std::string_view> v{
			std::string_view(storage).substr(0, 4),
			std::string_view(storage).substr(5, 5),
			std::string_view(storage).substr(11, 3),
			std::string_view(storage).substr(15, 5),
		};
		auto lt = less::of(v);
		REQUIRE(lt.leaves().size() == 1);
		CHECK(lt.leaves()[0].kind == type::kind::string);
		ordo::sort::sort_slice_stable(v, lt);
		CHECK(v == std::vector<std::string_view>{ "apple", "apple", "fig", "pear" });
		CHECK(v[0].data() == storage.data() + 5);
		CHECK(v[1].data() == storage.data() + 15);
	}

	TEST_CASE("of: packed layouts read unaligned leaves") {
		std::vector<packed_row> v(3);
		v[0].tag = 1; v[0].id = 30; v[0].weight = 0.5;
		v[1].tag = 1; v[1].id = 10; v[1].weight = 2.0;
		v[2].tag = 0; v[2].id = 99; v[2].weight = 1.0;
		sort_all(v);
		CHECK(v[0].id == 99);
		CHECK(v[1].id == 10);
		CHECK(v[2].id == 30);
	}

	TEST_CASE("of: handles compare by identity") {
		std::array<int, 4> pool{ 40, 30, 20, 10 };

		SUBCASE("raw pointers") {
			std::vector<int*> v{ &pool[2], &pool[0], &pool[3], &pool[1] };
			sort_all(v);
			CHECK(v == std::vector<int*>{ &pool[0], &pool[1], &pool[2], &pool[3] });
		}

		SUBCASE("shared pointers") {
			std::vector<std::shared_ptr<int>> v;
			for (int i = 0; i < 8; ++i) {
				v.push_back(std::make_shared<int>(i));
			}
			std::reverse(v.begin(), v.end());
			auto lt = less::of(v);
			ordo::sort::sort_slice(v, lt);
			CHECK(ordo::sort::is_sorted(v.size(), lt));
			for (std::size_t i = 1; i < v.size(); ++i) {
				CHECK(reinterpret_cast<std::uintptr_t>(v[i - 1].get()) < reinterpret_cast<std::uintptr_t>(v[i].get()));
			}
		}

		SUBCASE("runtime chan descriptor") {
			auto chan = type::descriptor::opaque(type::kind::chan, "chan", sizeof(std::uintptr_t),
				[](const core::byte* where) { return core::load_word<std::uintptr_t>(where); });
			std::uintptr_t handles[3] = { 0x3000, 0x1000, 0x2000 };
			auto lt = less::of(type::value_ref(handles, type::descriptor::array(chan, 3)));
			CHECK(lt.leaves()[0].kind == type::kind::chan);
			CHECK(ordo::sort::sorted_order(3, lt) == std::vector<std::size_t>{ 1, 2, 0 });
		}
	}

	TEST_CASE("of: runtime uintptr descriptor") {
		std::uintptr_t addrs[4] = { 7, 3, 5, 1 };
		auto lt = less::of(type::value_ref(addrs,
			type::descriptor::array(type::descriptor::numeric(type::kind::uintptr, "uintptr"), 4)));
		ordo::sort::sort_slice(std::span<std::uintptr_t>(addrs), lt);
		CHECK(addrs[0] == 1);
		CHECK(addrs[3] == 7);
	}

	TEST_CASE("compile: leaf paths in priority order") {
		const auto chain = less::compile(type::type_of<segment>());
		const auto leaves = chain->leaves();
		REQUIRE(leaves.size() == 6);

		CHECK(leaves[0].path == "name");
		CHECK(leaves[0].kind == type::kind::string);
		CHECK(leaves[0].offset == 0);
		CHECK(leaves[1].path == "pos[0]");
		CHECK(leaves[1].kind == type::kind::i16);
		CHECK(leaves[2].path == "pos[1]");
		CHECK(leaves[2].offset == leaves[1].offset + sizeof(std::int16_t));
		CHECK(leaves[3].path == "z.real");
		CHECK(leaves[3].kind == type::kind::fp64);
		CHECK(leaves[4].path == "z.imag");
		CHECK(leaves[4].offset == leaves[3].offset + sizeof(double));
		CHECK(leaves[5].path == "flag");
		CHECK(leaves[5].kind == type::kind::boolean);

		std::ostringstream os;
		less::debug_print(os, *chain);
		const auto out = os.str();
		CHECK(out.find("chain: segment leaves=6") != std::string::npos);
		CHECK(out.find("[0] string @0 name") != std::string::npos);
		CHECK(out.find("[5] bool") != std::string::npos);
	}

	TEST_CASE("compile: leaves can be skipped") {
		std::vector<segment> v{
			{ "b", { 1, 2 }, { 0, 0 }, 0, false },
			{ "a", { 1, 2 }, { 0, 0 }, 0, false },
		};
		auto lt = less::of(v, less::settings{ .collect_leaves = false });
		CHECK(lt.leaves().empty());
		CHECK(lt(1, 0));
	}

	TEST_CASE("compile: record order follows declared priority") {
		std::vector<segment> v{
			{ "a", { 1, 2 }, { 0, 1 }, 0, true },
			{ "a", { 1, 2 }, { 0, 1 }, 5, false },
			{ "a", { 1, 2 }, { 0, -1 }, 0, true },
			{ "a", { 0, 9 }, { 9, 9 }, 0, true },
		};
		sort_all(v);
		CHECK(v[0].pos[0] == 0);
		CHECK(v[1].z.imag() == -1);
		CHECK(v[2].flag == false);
		CHECK(v[3].flag == true);
	}

	TEST_CASE("predicate: sorting is idempotent") {
		std::vector<string_int> v{ { "c", 1 }, { "a", 2 }, { "b", 0 }, { "a", 1 } };
		auto lt = less::of(v);
		ordo::sort::sort_slice(v, lt);
		const auto once = v;
		CHECK(ordo::sort::is_sorted(v.size(), lt));
		ordo::sort::sort_slice(v, lt);
		CHECK(v == once);
	}

	TEST_CASE("predicate: matches a hand-written comparator") {
		std::mt19937 gen(123);
		std::uniform_int_distribution<int> dist(0, 50);

		std::vector<string_int> v(500);
		for (auto& e : v) {
			e.s = std::to_string(dist(gen));
			e.i = dist(gen);
		}
		auto expected = v;
		std::sort(expected.begin(), expected.end(), [](const auto& a, const auto& b) {
			return std::tie(a.s, a.i) < std::tie(b.s, b.i);
		});

		sort_all(v);
		CHECK(v == expected);
	}

	TEST_CASE("predicate: reuse across sorts and rebinding") {
		std::vector<string_int> scratch{ { "b", 1 }, { "a", 1 } };
		auto lt = less::of(scratch);

		ordo::sort::sort_slice(scratch, lt);
		CHECK(scratch.front().s == "a");

		scratch = { { "z", 0 }, { "y", 0 } };
		ordo::sort::sort_slice(scratch, lt);
		CHECK(scratch.front().s == "y");

		std::vector<string_int> other{ { "q", 3 }, { "q", 1 }, { "p", 5 } };
		lt.rebind(type::ref(other));
		CHECK(lt.size() == 3);
		ordo::sort::sort_slice(other, lt);
		CHECK(other == std::vector<string_int>{ { "p", 5 }, { "q", 1 }, { "q", 3 } });

		std::vector<int> wrong{ 1, 2 };
		CHECK_THROWS_AS(lt.rebind(type::ref(wrong)), core::invalid_argument);

		less::predicate none;
		CHECK_THROWS_AS(none.rebind(type::ref(other)), core::invalid_argument);
	}

	TEST_CASE("chain: only the builder makes chains") {
		CHECK_FALSE((std::is_constructible_v<less::chain,
			type::descriptor_ptr, less::element_less, std::vector<less::leaf_path>>));

		less::builder b;
		const auto compiled = b.compile(type::type_of<string_int>());
		REQUIRE(compiled);
		std::vector<string_int> v{ { "b", 0 }, { "a", 0 } };
		auto lt = compiled->bind(core::as_bytes_ptr(v.data()), v.size());
		CHECK(lt.get_chain() == compiled);
		CHECK(lt(1, 0));
	}

	TEST_CASE("chain: one compilation, several collections") {
		const auto chain = less::compile(type::type_of<int>());
		std::vector<int> a{ 3, 1, 2 };
		std::vector<int> b{ 9, 8 };

		auto la = chain->bind(core::as_bytes_ptr(a.data()), a.size());
		auto lb = chain->bind(core::as_bytes_ptr(b.data()), b.size());
		CHECK(la.get_chain() == lb.get_chain());

		ordo::sort::sort_slice(a, la);
		ordo::sort::sort_slice(b, lb);
		CHECK(a == std::vector<int>{ 1, 2, 3 });
		CHECK(b == std::vector<int>{ 8, 9 });
	}
}
