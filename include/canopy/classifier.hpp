#pragma once

/**
 * Canopy Classifier Interface
 *
 * Common surface of DecisionTree and RandomForest so the grid search can fit,
 * score and reconfigure either one through a factory.
 */

#include "types.hpp"
#include "dataset.hpp"
#include "params.hpp"
#include <string>
#include <vector>

namespace canopy {

class Classifier {
public:
    virtual ~Classifier() = default;

    virtual void fit(const Dataset& dataset) = 0;

    /**
     * One label per row of X; throws if unfitted or X has the wrong width
     */
    virtual LabelVector predict(const Matrix& X) const = 0;

    /**
     * Normalized per-feature importance (sums to 1, or all zeros)
     */
    virtual std::vector<Float> feature_importances() const = 0;

    virtual ModelComplexity complexity() const = 0;

    /**
     * Set a hyperparameter by name; takes effect on the next fit()
     */
    virtual void set_param(const std::string& name, const ParamValue& value) = 0;

    virtual bool is_fitted() const = 0;
    virtual FeatureIndex n_features() const = 0;
};

} // namespace canopy
