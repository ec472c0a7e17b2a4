#pragma once

/**
 * Canopy Split Search
 *
 * Finds the binary partition of a row set that minimizes the weighted
 * post-split impurity:
 *
 *   score = (n_left * I(left) + n_right * I(right)) / n
 *
 * Ordered features try value <= t for candidate thresholds t; unordered
 * features try value == c against the rest for candidate categories c.
 * Both candidate sets are capped at max_candidates (percentiles of the column
 * for thresholds, most frequent values for categories).
 */

#include "types.hpp"
#include "config.hpp"
#include "criterion.hpp"
#include "dataset.hpp"
#include <vector>

namespace canopy {

// ============================================================================
// Split Information
// ============================================================================

struct SplitInfo {
    FeatureIndex feature = 0;
    FeatureKind kind = FeatureKind::Ordered;
    Float value = 0.0;              // Threshold (ordered) or category (unordered)
    Float score = INF;              // Weighted child impurity
    bool is_valid = false;

    bool goes_left(Float x) const {
        return kind == FeatureKind::Ordered ? x <= value : x == value;
    }
};

// ============================================================================
// Split Finder
// ============================================================================

class SplitFinder {
public:
    explicit SplitFinder(Criterion criterion, Index max_candidates = DEFAULT_MAX_CANDIDATES);

    /**
     * Best split over the given features, in the given order.
     * Ties keep the first feature encountered; is_valid is false when no
     * feature has an admissible candidate.
     */
    SplitInfo find_best_split(
        const Dataset& dataset,
        const std::vector<Index>& rows,
        const std::vector<FeatureIndex>& features,
        Float parent_impurity
    ) const;

    /**
     * Best split of a single feature
     */
    SplitInfo find_feature_split(
        const Dataset& dataset,
        const std::vector<Index>& rows,
        FeatureIndex feature,
        Float parent_impurity
    ) const;

    /**
     * Candidate thresholds: the distinct values, or max_candidates evenly
     * spaced percentiles (linear interpolation) when there are more.
     */
    std::vector<Float> threshold_candidates(std::vector<Float> values) const;

    /**
     * Candidate categories: the distinct values in ascending order, or the
     * max_candidates most frequent ones (ties to the smaller value).
     */
    std::vector<Float> category_candidates(const std::vector<Float>& values) const;

    /**
     * Route rows to the two children of a split
     */
    static void partition(
        const Dataset& dataset,
        const std::vector<Index>& rows,
        const SplitInfo& split,
        std::vector<Index>& left,
        std::vector<Index>& right
    );

    const ImpurityCriterion& criterion() const { return criterion_; }
    Index max_candidates() const { return max_candidates_; }

private:
    ImpurityCriterion criterion_;
    Index max_candidates_;

    // Score of one candidate; INF when either side is empty
    Float score_candidate(
        const Dataset& dataset,
        const std::vector<Index>& rows,
        FeatureIndex feature,
        const SplitInfo& candidate
    ) const;
};

} // namespace canopy
