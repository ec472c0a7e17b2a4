/**
 * Canopy Forest Benchmarks
 */

#include <benchmark/benchmark.h>
#include "canopy/forest.hpp"
#include <random>

using namespace canopy;

namespace {

Dataset make_forest_dataset(Index n_samples, FeatureIndex n_features) {
    Matrix X(n_samples, n_features);
    LabelVector y(n_samples);
    std::mt19937 rng(7);
    std::uniform_real_distribution<Float> dist(-1.0, 1.0);

    for (Index i = 0; i < n_samples; ++i) {
        for (FeatureIndex f = 0; f < n_features; ++f) {
            X(i, f) = dist(rng);
        }
        y[i] = X(i, 0) * X(i, 1) > 0.0 ? 1 : 0;
    }
    return Dataset(X, y);
}

} // namespace

// Benchmark forest training across member counts
static void BM_ForestFit(benchmark::State& state) {
    Dataset data = make_forest_dataset(1000, 16);

    ForestConfig config;
    config.n_estimators = static_cast<uint32_t>(state.range(0));
    config.tree.max_depth = 10;

    for (auto _ : state) {
        RandomForest forest(config);
        forest.fit(data);
        benchmark::DoNotOptimize(forest.n_trees());
    }
}
BENCHMARK(BM_ForestFit)->Range(8, 64);

// Benchmark majority-vote prediction
static void BM_ForestPredict(benchmark::State& state) {
    Index n_samples = state.range(0);
    Dataset train = make_forest_dataset(1000, 16);
    Dataset test = make_forest_dataset(n_samples, 16);

    ForestConfig config;
    config.n_estimators = 50;
    RandomForest forest(config);
    forest.fit(train);

    for (auto _ : state) {
        LabelVector output = forest.predict(test.features());
        benchmark::DoNotOptimize(output);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_ForestPredict)->Range(100, 10000);
