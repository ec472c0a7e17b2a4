#pragma once

/**
 * Canopy Cross-Validated Grid Search
 *
 * Every combination of the grid is scored by k-fold cross-validation on a
 * fresh model per fold. Selection prefers the most accurate combination among
 * those reaching acceptable_accuracy, then the shallower, then the smaller
 * one. When none qualifies the globally most accurate combination wins and
 * the outcome is flagged with used_fallback.
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "params.hpp"
#include "classifier.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace canopy {

struct SearchResult {
    Float mean_accuracy = 0.0;
    Float mean_depth = 0.0;
    Float mean_n_nodes = 0.0;
    ParamSet params;
    std::vector<Float> fold_accuracies;
};

struct SearchOutcome {
    ParamSet best_params;
    std::unique_ptr<Classifier> best_model;  // Refit on the full dataset
    size_t best_index = 0;                   // Position in results
    bool used_fallback = false;
    std::vector<SearchResult> results;       // Grid order
};

// Produces a fresh, unfitted model holding the fixed (non-grid) parameters
using ClassifierFactory = std::function<std::unique_ptr<Classifier>()>;

class GridSearch {
public:
    GridSearch(ClassifierFactory factory, ParamGrid grid, const SearchConfig& config = {});

    SearchOutcome run(const Dataset& dataset) const;

    /**
     * Selection policy over scored combinations.
     * @param used_fallback Set when no result reaches acceptable_accuracy
     * @return Index of the winner in results
     */
    static size_t select_best(
        const std::vector<SearchResult>& results,
        Float acceptable_accuracy,
        bool& used_fallback
    );

    const ParamGrid& grid() const { return grid_; }
    const SearchConfig& config() const { return config_; }

private:
    ClassifierFactory factory_;
    ParamGrid grid_;
    SearchConfig config_;

    std::unique_ptr<Classifier> make_model(const ParamSet& params) const;
};

} // namespace canopy
