/**
 * Canopy Impurity Criteria Implementation
 */

#include "canopy/criterion.hpp"
#include <algorithm>
#include <cmath>

namespace canopy {

// ============================================================================
// Class Histogram
// ============================================================================

void ClassCounts::add(Label label, Index n) {
    for (size_t i = 0; i < labels_.size(); ++i) {
        if (labels_[i] == label) {
            counts_[i] += n;
            total_ += n;
            return;
        }
    }
    labels_.push_back(label);
    counts_.push_back(n);
    total_ += n;
}

void ClassCounts::clear() {
    labels_.clear();
    counts_.clear();
    total_ = 0;
}

Label ClassCounts::majority() const {
    Label best_label = 0;
    Index best_count = 0;
    for (size_t i = 0; i < labels_.size(); ++i) {
        if (counts_[i] > best_count ||
            (counts_[i] == best_count && labels_[i] < best_label)) {
            best_count = counts_[i];
            best_label = labels_[i];
        }
    }
    return best_label;
}

ClassCounts ClassCounts::of(const LabelVector& labels) {
    ClassCounts counts;
    for (Label label : labels) {
        counts.add(label);
    }
    return counts;
}

ClassCounts ClassCounts::of(const LabelVector& labels, const std::vector<Index>& rows) {
    ClassCounts counts;
    for (Index row : rows) {
        counts.add(labels[row]);
    }
    return counts;
}

// ============================================================================
// Criteria
// ============================================================================

Float ImpurityCriterion::gini(const ClassCounts& counts) {
    if (counts.empty()) return 0.0;
    const Float n = static_cast<Float>(counts.total());

    if (counts.n_classes() == 2) {
        Float p = counts.counts()[0] / n;
        return 2.0 * p * (1.0 - p);
    }

    Float sum_sq = 0.0;
    for (Index c : counts.counts()) {
        Float p = c / n;
        sum_sq += p * p;
    }
    return 1.0 - sum_sq;
}

Float ImpurityCriterion::entropy(const ClassCounts& counts) {
    if (counts.empty()) return 0.0;
    const Float n = static_cast<Float>(counts.total());

    Float h = 0.0;
    for (Index c : counts.counts()) {
        if (c == 0) continue;
        Float p = c / n;
        h -= p * std::log2(p);
    }
    return h > 0.0 ? h / 2.0 : 0.0;
}

Float ImpurityCriterion::error(const ClassCounts& counts) {
    if (counts.empty()) return 0.0;
    Index max_count = *std::max_element(counts.counts().begin(), counts.counts().end());
    return 1.0 - static_cast<Float>(max_count) / counts.total();
}

Float ImpurityCriterion::sqrt(const ClassCounts& counts) {
    if (counts.n_classes() < 2) return 0.0;
    Float p = static_cast<Float>(counts.counts()[0]) / counts.total();
    return std::sqrt(p * (1.0 - p));
}

Float ImpurityCriterion::operator()(const ClassCounts& counts) const {
    switch (criterion_) {
        case Criterion::Gini: return gini(counts);
        case Criterion::Entropy: return entropy(counts);
        case Criterion::Error: return error(counts);
        case Criterion::Sqrt: return sqrt(counts);
    }
    return 0.0;
}

Float ImpurityCriterion::operator()(const LabelVector& labels) const {
    return (*this)(ClassCounts::of(labels));
}

} // namespace canopy
