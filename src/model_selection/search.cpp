/**
 * Canopy Grid Search Implementation
 */

#include "canopy/search.hpp"
#include "canopy/metrics.hpp"
#include "canopy/resampling.hpp"
#include "canopy/threading.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

namespace canopy {

namespace {

struct FoldScore {
    Float accuracy = 0.0;
    Float depth = 0.0;
    Float n_nodes = 0.0;
};

struct FoldData {
    Dataset train;
    Dataset validation;
};

} // namespace

GridSearch::GridSearch(ClassifierFactory factory, ParamGrid grid, const SearchConfig& config)
    : factory_(std::move(factory)), grid_(std::move(grid)), config_(config) {
    if (!factory_) {
        throw std::invalid_argument("GridSearch requires a model factory");
    }
    config_.validate();
}

std::unique_ptr<Classifier> GridSearch::make_model(const ParamSet& params) const {
    std::unique_ptr<Classifier> model = factory_();
    if (!model) {
        throw std::invalid_argument("model factory returned null");
    }
    for (const auto& [name, value] : params) {
        model->set_param(name, value);
    }
    return model;
}

// ============================================================================
// Selection
// ============================================================================

size_t GridSearch::select_best(
    const std::vector<SearchResult>& results,
    Float acceptable_accuracy,
    bool& used_fallback
) {
    if (results.empty()) {
        throw std::invalid_argument("cannot select from an empty result list");
    }

    // Accuracy first, then shallower, then fewer nodes; earlier wins full ties
    auto better = [](const SearchResult& a, const SearchResult& b) {
        if (a.mean_accuracy != b.mean_accuracy) return a.mean_accuracy > b.mean_accuracy;
        if (a.mean_depth != b.mean_depth) return a.mean_depth < b.mean_depth;
        return a.mean_n_nodes < b.mean_n_nodes;
    };

    bool found = false;
    size_t best = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].mean_accuracy < acceptable_accuracy) continue;
        if (!found || better(results[i], results[best])) {
            best = i;
            found = true;
        }
    }

    used_fallback = !found;
    if (found) return best;

    best = 0;
    for (size_t i = 1; i < results.size(); ++i) {
        if (results[i].mean_accuracy > results[best].mean_accuracy) {
            best = i;
        }
    }
    return best;
}

// ============================================================================
// Search
// ============================================================================

SearchOutcome GridSearch::run(const Dataset& dataset) const {
    config_.validate();

    if (dataset.empty()) {
        throw std::invalid_argument("cannot search on an empty dataset");
    }

    const std::vector<ParamSet> combos = expand_grid(grid_);

    // Reject bad names and values before any fitting
    for (const auto& params : combos) {
        make_model(params);
    }

    const std::vector<Fold> folds =
        KFold(config_.n_folds, config_.shuffle, config_.seed).split(dataset.n_samples());

    std::vector<FoldData> fold_data;
    fold_data.reserve(folds.size());
    for (const auto& fold : folds) {
        fold_data.push_back({dataset.subset(fold.train), dataset.subset(fold.validation)});
    }

    const size_t n_folds = folds.size();
    const size_t n_units = combos.size() * n_folds;

    if (config_.verbosity > 0) {
        std::printf("Grid search: %zu combinations x %zu folds (%zu fits)\n",
                    combos.size(), n_folds, n_units);
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    std::vector<FoldScore> scores(n_units);
    threading::parallel_for(0, n_units, [&](size_t unit) {
        const size_t c = unit / n_folds;
        const FoldData& data = fold_data[unit % n_folds];

        std::unique_ptr<Classifier> model = make_model(combos[c]);
        model->fit(data.train);

        const LabelVector predicted = model->predict(data.validation.features());
        const ModelComplexity complexity = model->complexity();

        FoldScore& score = scores[unit];
        score.accuracy = Metrics::accuracy(data.validation.labels(), predicted);
        score.depth = complexity.depth;
        score.n_nodes = complexity.n_nodes;
    }, config_.n_threads);

    // Aggregate per combination
    std::vector<SearchResult> results(combos.size());
    for (size_t c = 0; c < combos.size(); ++c) {
        SearchResult& r = results[c];
        r.params = combos[c];
        r.fold_accuracies.reserve(n_folds);
        for (size_t k = 0; k < n_folds; ++k) {
            const FoldScore& s = scores[c * n_folds + k];
            r.fold_accuracies.push_back(s.accuracy);
            r.mean_accuracy += s.accuracy;
            r.mean_depth += s.depth;
            r.mean_n_nodes += s.n_nodes;
        }
        r.mean_accuracy /= static_cast<Float>(n_folds);
        r.mean_depth /= static_cast<Float>(n_folds);
        r.mean_n_nodes /= static_cast<Float>(n_folds);

        if (config_.verbosity > 1) {
            std::printf("[DEBUG] %s: accuracy=%.4f depth=%.2f nodes=%.1f\n",
                        to_string(r.params).c_str(), r.mean_accuracy,
                        r.mean_depth, r.mean_n_nodes);
        }
    }

    SearchOutcome outcome;
    outcome.best_index = select_best(results, config_.acceptable_accuracy, outcome.used_fallback);
    outcome.best_params = results[outcome.best_index].params;

    if (outcome.used_fallback && config_.verbosity > 0) {
        std::printf("[WARN] No combination reached accuracy %.4f, "
                    "falling back to the most accurate one\n",
                    config_.acceptable_accuracy);
    }

    std::unique_ptr<Classifier> final_model = make_model(outcome.best_params);
    final_model->fit(dataset);
    outcome.best_model = std::move(final_model);

    if (config_.verbosity > 0) {
        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed = std::chrono::duration<double>(end_time - start_time).count();
        std::printf("Best: %s (cv accuracy %.4f) in %.2fs\n",
                    to_string(outcome.best_params).c_str(),
                    results[outcome.best_index].mean_accuracy, elapsed);
    }

    outcome.results = std::move(results);
    return outcome;
}

} // namespace canopy
