/**
 * Canopy Random Forest Implementation
 */

#include "canopy/forest.hpp"
#include "canopy/threading.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

namespace canopy {

RandomForest::RandomForest(const ForestConfig& config) : config_(config) {
    config_.validate();
}

void RandomForest::fit(const Dataset& dataset) {
    config_.validate();

    if (dataset.empty()) {
        throw std::invalid_argument("cannot fit a forest on an empty dataset");
    }
    if (dataset.n_features() == 0) {
        throw std::invalid_argument("cannot fit a forest on a dataset without features");
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    const uint32_t n_trees = config_.n_estimators;
    const Index n_samples = dataset.n_samples();

    // Member seeds come from the root source in member order, before any
    // parallel work, so scheduling cannot change them
    std::mt19937_64 root_rng(config_.seed);
    std::vector<uint64_t> member_seeds(n_trees);
    for (auto& seed : member_seeds) {
        seed = root_rng();
    }

    std::vector<std::unique_ptr<DecisionTree>> trees(n_trees);

    threading::parallel_for(0, n_trees, [&](size_t t) {
        std::mt19937_64 rng(member_seeds[t]);

        // Bootstrap: n draws with replacement
        std::uniform_int_distribution<Index> pick(0, n_samples - 1);
        std::vector<Index> rows(n_samples);
        for (auto& row : rows) {
            row = pick(rng);
        }

        TreeConfig tree_config = config_.tree;
        tree_config.seed = rng();

        auto tree = std::make_unique<DecisionTree>(tree_config);
        tree->fit(dataset, rows);
        trees[t] = std::move(tree);
    }, config_.n_threads);

    // Sum member importances and renormalize
    std::vector<Float> importances(dataset.n_features(), 0.0);
    for (const auto& tree : trees) {
        const auto imp = tree->feature_importances();
        for (size_t f = 0; f < imp.size(); ++f) {
            importances[f] += imp[f];
        }
    }
    Float sum = std::accumulate(importances.begin(), importances.end(), 0.0);
    if (sum > 0.0) {
        for (auto& v : importances) {
            v /= sum;
        }
    }

    trees_ = std::move(trees);
    importances_ = std::move(importances);
    classes_ = dataset.classes();
    n_features_ = dataset.n_features();

    if (config_.verbosity > 0) {
        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed = std::chrono::duration<double>(end_time - start_time).count();
        ModelComplexity c = complexity();
        std::printf("Forest fitted: %zu trees in %.2fs (mean depth %.2f, mean nodes %.1f)\n",
                    trees_.size(), elapsed, c.depth, c.n_nodes);
    }
}

// ============================================================================
// Prediction
// ============================================================================

std::vector<LabelVector> RandomForest::member_predictions(const Matrix& X) const {
    if (trees_.empty()) {
        throw std::runtime_error("RandomForest not fitted. Call fit() first.");
    }
    if (static_cast<FeatureIndex>(X.cols()) != n_features_) {
        throw std::invalid_argument("expected " + std::to_string(n_features_) +
                                    " features, got " + std::to_string(X.cols()));
    }

    std::vector<LabelVector> predictions(trees_.size());
    threading::parallel_for(0, trees_.size(), [&](size_t t) {
        predictions[t] = trees_[t]->predict(X);
    }, config_.n_threads);
    return predictions;
}

std::vector<std::vector<Index>> RandomForest::predict_votes(const Matrix& X) const {
    const std::vector<LabelVector> predictions = member_predictions(X);

    const size_t n_rows = static_cast<size_t>(X.rows());
    std::vector<std::vector<Index>> votes(n_rows, std::vector<Index>(classes_.size(), 0));

    for (const auto& member : predictions) {
        for (size_t i = 0; i < n_rows; ++i) {
            auto it = std::lower_bound(classes_.begin(), classes_.end(), member[i]);
            ++votes[i][static_cast<size_t>(it - classes_.begin())];
        }
    }
    return votes;
}

LabelVector RandomForest::predict(const Matrix& X) const {
    const auto votes = predict_votes(X);

    LabelVector output(votes.size());
    for (size_t i = 0; i < votes.size(); ++i) {
        // classes_ is sorted, so the first maximum is the smallest tied label
        auto best = std::max_element(votes[i].begin(), votes[i].end());
        output[i] = classes_[static_cast<size_t>(best - votes[i].begin())];
    }
    return output;
}

// ============================================================================
// Introspection
// ============================================================================

ModelComplexity RandomForest::complexity() const {
    ModelComplexity c;
    if (trees_.empty()) return c;

    for (const auto& tree : trees_) {
        c.depth += tree->depth();
        c.n_nodes += tree->n_nodes();
    }
    c.depth /= static_cast<Float>(trees_.size());
    c.n_nodes /= static_cast<Float>(trees_.size());
    return c;
}

void RandomForest::set_param(const std::string& name, const ParamValue& value) {
    if (!apply_forest_param(config_, name, value)) {
        throw std::invalid_argument("unknown forest parameter '" + name + "'");
    }
}

} // namespace canopy
