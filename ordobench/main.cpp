#include "ordo/less/builder.hpp"
#include "ordo/less/debug.hpp"
#include "ordo/sort/slice.hpp"
#include "ordo/type/debug.hpp"
#include "ordo/type/record.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <complex>
#include <format>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace {
	struct string_int {
		std::string s;
		std::int64_t i;
		bool operator == (const string_int&) const = default;
	};

	struct sample_row {
		std::string name;
		std::array<std::int16_t, 2> pos;
		std::complex<double> z;
		std::int32_t reserved;
		bool flag;
	};
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
	struct describe<sample_row> {
		static descriptor_ptr get() {
			return record_builder<sample_row>("sample_row")
				.field("name", &sample_row::name)
				.field("pos", &sample_row::pos)
				.field("z", &sample_row::z)
				.discard(&sample_row::reserved)
				.field("flag", &sample_row::flag)
				.build();
		}
	};
}

namespace {
	using clock_type = std::chrono::steady_clock;

	constexpr std::size_t DEFAULT_COUNT = 10000;
	constexpr unsigned DEFAULT_SEED = 123;
	constexpr std::size_t DEFAULT_ROUNDS = 20;

	std::vector<string_int> make_unsorted(std::size_t count, unsigned seed) {
		std::mt19937 gen(seed);
		std::uniform_int_distribution<std::int64_t> dist(0, 999999999);
		std::vector<string_int> res(count);
		for (auto& r : res) {
			r.s = std::to_string(dist(gen));
			r.i = dist(gen);
		}
		return res;
	}

	// Average microseconds per call of fn.
	template <typename Fn>
	double timed(std::size_t rounds, Fn&& fn) {
		const auto start = clock_type::now();
		for (std::size_t r = 0; r < rounds; ++r) {
			fn();
		}
		const auto spent = std::chrono::duration<double, std::micro>(clock_type::now() - start);
		return spent.count() / static_cast<double>(rounds == 0 ? 1 : rounds);
	}

	int cmd_bench(std::size_t count, unsigned seed, std::size_t rounds) {
		try {
			const auto unsorted = make_unsorted(count, seed);
			std::vector<string_int> buf(unsorted.size());

			const auto native_us = timed(rounds, [&]() {
				std::copy(unsorted.begin(), unsorted.end(), buf.begin());
				ordo::sort::sort_slice(buf, [&buf](std::size_t i, std::size_t j) {
					const auto& a = buf[i];
					const auto& b = buf[j];
					if (a.s == b.s) {
						return a.i < b.i;
					}
					return a.s < b.s;
				});
			});
			const auto native_out = buf;

			const auto generated_us = timed(rounds, [&]() {
				std::copy(unsorted.begin(), unsorted.end(), buf.begin());
				ordo::sort::sort_slice(buf, ordo::less::of(buf));
			});
			const auto generated_out = buf;

			const auto lt = ordo::less::of(buf);
			const auto reused_us = timed(rounds, [&]() {
				std::copy(unsorted.begin(), unsorted.end(), buf.begin());
				ordo::sort::sort_slice(buf, lt);
			});

			std::cout << std::format("records: {}  rounds: {}  seed: {}\n", count, rounds, seed);
			std::cout << std::format("  native    {:>12.1f} us/round\n", native_us);
			std::cout << std::format("  generated {:>12.1f} us/round\n", generated_us);
			std::cout << std::format("  reused    {:>12.1f} us/round\n", reused_us);

			if (generated_out != native_out || buf != native_out) {
				std::cerr << "Orders differ between native and generated predicates\n";
				return 1;
			}
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error running benchmark: " << e.what() << "\n";
			return 1;
		}
	}

	template <typename T>
	void print_layout() {
		const auto& t = ordo::type::type_of<T>();
		ordo::type::debug_print(std::cout, *t);
		ordo::less::debug_print(std::cout, *ordo::less::compile(t));
		std::cout << "\n";
	}

	int cmd_layout() {
		try {
			print_layout<string_int>();
			print_layout<sample_row>();
			print_layout<std::array<std::complex<float>, 2>>();
			return 0;
		}
		catch (const std::exception& e) {
			std::cerr << "Error printing layout: " << e.what() << "\n";
			return 1;
		}
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "ordobench - generated less-than predicates" };
	app.require_subcommand(1);

	std::size_t count = DEFAULT_COUNT;
	unsigned seed = DEFAULT_SEED;
	std::size_t rounds = DEFAULT_ROUNDS;
	int result = 0;

	auto bench_cmd = app.add_subcommand("bench", "Compare native, generated and reused predicates");
	bench_cmd->add_option("-n,--count", count, "Number of records")->default_val(DEFAULT_COUNT);
	bench_cmd->add_option("-s,--seed", seed, "Random seed")->default_val(DEFAULT_SEED);
	bench_cmd->add_option("-r,--rounds", rounds, "Sort rounds per strategy")->default_val(DEFAULT_ROUNDS);
	bench_cmd->callback([&]() {
		result = cmd_bench(count, seed, rounds);
		});

	auto layout_cmd = app.add_subcommand("layout", "Print descriptors and leaf chains of the demo types");
	layout_cmd->callback([&]() {
		result = cmd_layout();
		});

	CLI11_PARSE(app, argc, argv);

	return result;
}
