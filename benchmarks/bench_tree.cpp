/**
 * Canopy Tree Benchmarks
 */

#include <benchmark/benchmark.h>
#include "canopy/tree.hpp"
#include "canopy/split_finder.hpp"
#include <numeric>
#include <random>
#include <vector>

using namespace canopy;

namespace {

Dataset make_dataset(Index n_samples, FeatureIndex n_features) {
    Matrix X(n_samples, n_features);
    LabelVector y(n_samples);
    std::mt19937 rng(123);
    std::uniform_real_distribution<Float> dist(-1.0, 1.0);

    for (Index i = 0; i < n_samples; ++i) {
        Float score = 0.0;
        for (FeatureIndex f = 0; f < n_features; ++f) {
            X(i, f) = dist(rng);
            if (f < 3) score += X(i, f);
        }
        y[i] = score > 0.0 ? 1 : 0;
    }
    return Dataset(X, y);
}

} // namespace

// Benchmark full tree growth
static void BM_TreeFit(benchmark::State& state) {
    Index n_samples = state.range(0);
    Dataset data = make_dataset(n_samples, 20);

    TreeConfig config;
    config.max_depth = 8;

    for (auto _ : state) {
        DecisionTree tree(config);
        tree.fit(data);
        benchmark::DoNotOptimize(tree.n_nodes());
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_TreeFit)->Range(256, 8192);

// Benchmark the root split search over all features
static void BM_SplitFinding(benchmark::State& state) {
    FeatureIndex n_features = state.range(0);
    Dataset data = make_dataset(2000, n_features);

    SplitFinder finder(Criterion::Gini);

    std::vector<Index> rows(data.n_samples());
    std::iota(rows.begin(), rows.end(), static_cast<Index>(0));
    std::vector<FeatureIndex> features(n_features);
    std::iota(features.begin(), features.end(), static_cast<FeatureIndex>(0));

    const Float parent = finder.criterion()(data.labels());

    for (auto _ : state) {
        auto split = finder.find_best_split(data, rows, features, parent);
        benchmark::DoNotOptimize(split);
    }
}
BENCHMARK(BM_SplitFinding)->Range(8, 128);

// Benchmark single-tree prediction
static void BM_TreePredict(benchmark::State& state) {
    Index n_samples = state.range(0);
    Dataset train = make_dataset(2000, 20);
    Dataset test = make_dataset(n_samples, 20);

    DecisionTree tree;
    tree.fit(train);

    for (auto _ : state) {
        LabelVector output = tree.predict(test.features());
        benchmark::DoNotOptimize(output);
    }

    state.SetItemsProcessed(state.iterations() * n_samples);
}
BENCHMARK(BM_TreePredict)->Range(100, 10000);

BENCHMARK_MAIN();
