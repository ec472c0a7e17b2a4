#pragma once

/**
 * Canopy Random Forest
 *
 * Bagged ensemble of decision trees. Each member is grown on its own bootstrap
 * sample with its own random source; member seeds are drawn in member order
 * from the forest root seed, so a fit is reproducible for a given seed and
 * n_estimators regardless of thread count. Prediction is a majority vote with
 * ties to the smallest label.
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "tree.hpp"
#include "classifier.hpp"
#include <memory>
#include <vector>

namespace canopy {

class RandomForest : public Classifier {
public:
    RandomForest() = default;
    explicit RandomForest(const ForestConfig& config);

    RandomForest(RandomForest&&) = default;
    RandomForest& operator=(RandomForest&&) = default;

    // Disable copy (has unique_ptr members)
    RandomForest(const RandomForest&) = delete;
    RandomForest& operator=(const RandomForest&) = delete;

    void fit(const Dataset& dataset) override;
    LabelVector predict(const Matrix& X) const override;

    /**
     * Vote tallies per row: votes[row][c] counts members predicting classes()[c]
     */
    std::vector<std::vector<Index>> predict_votes(const Matrix& X) const;

    std::vector<Float> feature_importances() const override { return importances_; }
    ModelComplexity complexity() const override;
    void set_param(const std::string& name, const ParamValue& value) override;

    bool is_fitted() const override { return !trees_.empty(); }
    FeatureIndex n_features() const override { return n_features_; }

    size_t n_trees() const { return trees_.size(); }
    const DecisionTree& tree(size_t idx) const { return *trees_[idx]; }

    // Sorted labels seen at fit time
    const LabelVector& classes() const { return classes_; }

    const ForestConfig& config() const { return config_; }

private:
    ForestConfig config_;
    std::vector<std::unique_ptr<DecisionTree>> trees_;
    std::vector<Float> importances_;
    LabelVector classes_;
    FeatureIndex n_features_ = 0;

    std::vector<LabelVector> member_predictions(const Matrix& X) const;
};

} // namespace canopy
