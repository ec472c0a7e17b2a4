#pragma once

/**
 * Canopy Impurity Criteria
 *
 * Label purity scores used to rank candidate splits. All four criteria are
 * functions of the class histogram of a row set only:
 *
 *   gini     2p(1-p) for exactly two classes, 1 - sum p_c^2 otherwise
 *   entropy  -sum p_c log2 p_c, halved
 *   error    1 - max_c p_c
 *   sqrt     sqrt(p(1-p)), p = share of the first observed class
 *
 * The binary gini form and the halved entropy keep pruning thresholds on the
 * same scale as the thresholds tuned against them; do not normalize them.
 */

#include "types.hpp"
#include <vector>

namespace canopy {

// ============================================================================
// Class Histogram
// ============================================================================

/**
 * Label counts in first-observed order. Binary and small multi-class label
 * sets dominate, so a linear scan beats hashing here.
 */
class ClassCounts {
public:
    ClassCounts() = default;

    void add(Label label, Index n = 1);
    void clear();

    Index total() const { return total_; }
    size_t n_classes() const { return labels_.size(); }
    bool empty() const { return total_ == 0; }

    const std::vector<Label>& labels() const { return labels_; }
    const std::vector<Index>& counts() const { return counts_; }

    /**
     * Most frequent label; ties go to the smallest label id
     */
    Label majority() const;

    static ClassCounts of(const LabelVector& labels);
    static ClassCounts of(const LabelVector& labels, const std::vector<Index>& rows);

private:
    std::vector<Label> labels_;
    std::vector<Index> counts_;
    Index total_ = 0;
};

// ============================================================================
// Impurity Criterion
// ============================================================================

class ImpurityCriterion {
public:
    explicit ImpurityCriterion(Criterion criterion = Criterion::Gini)
        : criterion_(criterion) {}

    Float operator()(const ClassCounts& counts) const;
    Float operator()(const LabelVector& labels) const;

    Criterion type() const { return criterion_; }

    static Float gini(const ClassCounts& counts);
    static Float entropy(const ClassCounts& counts);
    static Float error(const ClassCounts& counts);
    static Float sqrt(const ClassCounts& counts);

private:
    Criterion criterion_;
};

} // namespace canopy
