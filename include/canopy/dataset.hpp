#pragma once

/**
 * Canopy Dataset
 *
 * Dense feature matrix, integer labels and the ordered/unordered tag of every
 * column. The matrix is owned row-major so one row can be handed to the tree
 * walker as a plain pointer.
 */

#include "types.hpp"
#include <vector>

namespace canopy {

class Dataset {
public:
    Dataset() = default;

    /**
     * Create dataset from an owned matrix
     * @param features Row-major matrix [n_samples x n_features]
     * @param labels One non-negative label per row
     * @param kinds One FeatureKind per column; empty means all ordered
     */
    Dataset(Matrix features, LabelVector labels, std::vector<FeatureKind> kinds = {});

    /**
     * Create dataset from dense row-major buffer
     * @param unordered_features Indices of categorical columns
     */
    static Dataset from_dense(
        const Float* data,
        Index n_samples,
        FeatureIndex n_features,
        const Label* labels,
        const std::vector<FeatureIndex>& unordered_features = {}
    );

    // ========================================================================
    // Accessors
    // ========================================================================

    Index n_samples() const { return static_cast<Index>(features_.rows()); }
    FeatureIndex n_features() const { return static_cast<FeatureIndex>(features_.cols()); }
    bool empty() const { return labels_.empty(); }

    const Matrix& features() const { return features_; }
    const LabelVector& labels() const { return labels_; }
    const std::vector<FeatureKind>& kinds() const { return kinds_; }

    Float value(Index row, FeatureIndex feature) const { return features_(row, feature); }
    Label label(Index row) const { return labels_[row]; }
    const Float* row(Index row) const { return features_.data() + static_cast<size_t>(row) * features_.cols(); }

    FeatureKind kind(FeatureIndex feature) const { return kinds_[feature]; }
    bool is_unordered(FeatureIndex feature) const {
        return kinds_[feature] == FeatureKind::Unordered;
    }

    // ========================================================================
    // Derived Data
    // ========================================================================

    /**
     * Copy the given rows (repeats allowed) into a new dataset
     */
    Dataset subset(const std::vector<Index>& rows) const;

    /**
     * Sorted distinct labels
     */
    LabelVector classes() const;

private:
    Matrix features_;
    LabelVector labels_;
    std::vector<FeatureKind> kinds_;

    void validate() const;
};

} // namespace canopy
