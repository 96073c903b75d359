#pragma once
#include <benchmark/benchmark.h>
#include "SurveyStar.Core/code.h"

#include <map>
#include <string>
#include <unordered_map>

const auto numeric_text = std::string{" 12 "};
const auto symbolic_text = std::string{"NA"};

static void code_parse(benchmark::State &state, const std::string &text) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(sstar::core::Code::parse(text));
    }
}

static void code_compare(benchmark::State &state, const sstar::core::Code &lhs,
                         const sstar::core::Code &rhs) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(lhs < rhs);
    }
}

static void code_ordered_lookup(benchmark::State &state) {
    auto lookup = std::map<sstar::core::Code, int>{};
    for (auto i = 0; i < state.range(0); i++) {
        lookup.emplace(sstar::core::Code{i}, i);
    }

    auto key = sstar::core::Code{state.range(0) / 2};
    for (auto _ : state) {
        benchmark::DoNotOptimize(lookup.find(key));
    }
}

static void code_hashed_lookup(benchmark::State &state) {
    auto lookup = std::unordered_map<sstar::core::Code, int>{};
    for (auto i = 0; i < state.range(0); i++) {
        lookup.emplace(sstar::core::Code{i}, i);
    }

    auto key = sstar::core::Code{state.range(0) / 2};
    for (auto _ : state) {
        benchmark::DoNotOptimize(lookup.find(key));
    }
}

BENCHMARK_CAPTURE(code_parse, numeric, numeric_text);
BENCHMARK_CAPTURE(code_parse, symbolic, symbolic_text);
BENCHMARK_CAPTURE(code_compare, numeric, sstar::core::Code{1}, sstar::core::Code{2});
BENCHMARK_CAPTURE(code_compare, mixed, sstar::core::Code{1}, sstar::core::Code{std::string{"A"}});
BENCHMARK_CAPTURE(code_compare, symbolic, sstar::core::Code{std::string{"A"}},
                  sstar::core::Code{std::string{"B"}});
BENCHMARK(code_ordered_lookup)->Arg(8)->Arg(64)->Arg(512);
BENCHMARK(code_hashed_lookup)->Arg(8)->Arg(64)->Arg(512);
