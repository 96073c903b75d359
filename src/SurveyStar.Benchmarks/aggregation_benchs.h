#pragma once
#include <benchmark/benchmark.h>
#include "SurveyStar.Core/column_numeric.h"
#include "SurveyStar/bucketizer.h"
#include "SurveyStar/weighted_aggregator.h"

#include <random>
#include <vector>

static sstar::core::DataTable create_bench_fact(std::size_t rows) {
    auto engine = std::mt19937{20231019};
    auto group = std::uniform_int_distribution<int>{1, 12};
    auto weight = std::uniform_real_distribution<double>{0.5, 3.5};
    auto access = std::bernoulli_distribution{0.7};

    auto groups = std::vector<int>(rows);
    auto weights = std::vector<double>(rows);
    auto conditions = std::vector<int>(rows);
    for (std::size_t i = 0; i < rows; i++) {
        groups[i] = group(engine);
        weights[i] = weight(engine);
        conditions[i] = access(engine) ? 1 : 0;
    }

    auto table = sstar::core::DataTable{};
    table.add(std::make_unique<sstar::core::IntegerDataTableColumn>("GROUP", std::move(groups)));
    table.add(std::make_unique<sstar::core::DoubleDataTableColumn>("WEIGHT", std::move(weights)));
    table.add(
        std::make_unique<sstar::core::IntegerDataTableColumn>("ACCESS", std::move(conditions)));
    return table;
}

static std::vector<std::optional<double>> create_bench_incomes(std::size_t rows) {
    auto engine = std::mt19937{20231019};
    auto income = std::lognormal_distribution<double>{10.5, 0.8};
    auto values = std::vector<std::optional<double>>{};
    values.reserve(rows);
    for (std::size_t i = 0; i < rows; i++) {
        values.emplace_back(i % 20 == 0 ? std::optional<double>{} : income(engine));
    }

    return values;
}

static void weighted_aggregate(benchmark::State &state) {
    auto fact = create_bench_fact(static_cast<std::size_t>(state.range(0)));
    auto options = sstar::AggregationOptions{
        .group_column = "GROUP", .weight_column = "WEIGHT", .condition_column = "ACCESS"};

    for (auto _ : state) {
        benchmark::DoNotOptimize(sstar::WeightedAggregator::aggregate(fact, options));
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void quantile_assign(benchmark::State &state) {
    auto values = create_bench_incomes(static_cast<std::size_t>(state.range(0)));
    auto bucketizer = sstar::QuantileBucketizer{};

    for (auto _ : state) {
        benchmark::DoNotOptimize(bucketizer.assign(values));
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void fixed_edge_assign(benchmark::State &state) {
    auto values = create_bench_incomes(static_cast<std::size_t>(state.range(0)));
    auto bucketizer = sstar::FixedEdgeBucketizer{sstar::default_age_bands()};

    for (auto _ : state) {
        benchmark::DoNotOptimize(bucketizer.assign(values));
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(weighted_aggregate)->Arg(1000)->Arg(10000)->Arg(100000);
BENCHMARK(quantile_assign)->Arg(1000)->Arg(10000)->Arg(100000);
BENCHMARK(fixed_edge_assign)->Arg(1000)->Arg(10000)->Arg(100000);
