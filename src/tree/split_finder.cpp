/**
 * Canopy Split Search Implementation
 */

#include "canopy/split_finder.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace canopy {

SplitFinder::SplitFinder(Criterion criterion, Index max_candidates)
    : criterion_(criterion), max_candidates_(max_candidates) {
    if (max_candidates_ < 1) {
        throw std::invalid_argument("max_candidates must be at least 1");
    }
}

// ============================================================================
// Candidate Generation
// ============================================================================

std::vector<Float> SplitFinder::threshold_candidates(std::vector<Float> values) const {
    std::sort(values.begin(), values.end());

    std::vector<Float> distinct = values;
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    if (distinct.size() <= max_candidates_) {
        return distinct;
    }

    // Percentiles 0, 100/(m-1), ..., 100 over the full column
    std::vector<Float> thresholds;
    thresholds.reserve(max_candidates_);
    const size_t n = values.size();
    for (Index i = 0; i < max_candidates_; ++i) {
        Float q = max_candidates_ > 1 ? static_cast<Float>(i) / (max_candidates_ - 1) : 0.0;
        Float pos = q * static_cast<Float>(n - 1);
        size_t lo = static_cast<size_t>(std::floor(pos));
        size_t hi = std::min(lo + 1, n - 1);
        Float frac = pos - static_cast<Float>(lo);
        thresholds.push_back(values[lo] + (values[hi] - values[lo]) * frac);
    }

    thresholds.erase(std::unique(thresholds.begin(), thresholds.end()), thresholds.end());
    return thresholds;
}

std::vector<Float> SplitFinder::category_candidates(const std::vector<Float>& values) const {
    std::vector<Float> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    // (category, count) in ascending category order
    std::vector<std::pair<Float, Index>> freq;
    for (Float v : sorted) {
        if (freq.empty() || freq.back().first != v) {
            freq.emplace_back(v, 1);
        } else {
            ++freq.back().second;
        }
    }

    if (freq.size() > max_candidates_) {
        std::stable_sort(freq.begin(), freq.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        freq.resize(max_candidates_);
    }

    std::vector<Float> categories;
    categories.reserve(freq.size());
    for (const auto& entry : freq) {
        categories.push_back(entry.first);
    }
    return categories;
}

// ============================================================================
// Scoring
// ============================================================================

Float SplitFinder::score_candidate(
    const Dataset& dataset,
    const std::vector<Index>& rows,
    FeatureIndex feature,
    const SplitInfo& candidate
) const {
    ClassCounts left, right;
    const LabelVector& labels = dataset.labels();

    for (Index row : rows) {
        if (candidate.goes_left(dataset.value(row, feature))) {
            left.add(labels[row]);
        } else {
            right.add(labels[row]);
        }
    }

    if (left.empty() || right.empty()) {
        return INF;
    }

    const Float n_left = static_cast<Float>(left.total());
    const Float n_right = static_cast<Float>(right.total());
    return (n_left * criterion_(left) + n_right * criterion_(right)) / (n_left + n_right);
}

SplitInfo SplitFinder::find_feature_split(
    const Dataset& dataset,
    const std::vector<Index>& rows,
    FeatureIndex feature,
    Float parent_impurity
) const {
    SplitInfo best;
    best.feature = feature;
    best.kind = dataset.kind(feature);

    if (rows.size() < 2) {
        return best;
    }

    std::vector<Float> column;
    column.reserve(rows.size());
    for (Index row : rows) {
        column.push_back(dataset.value(row, feature));
    }

    std::vector<Float> candidates = best.kind == FeatureKind::Ordered
        ? threshold_candidates(std::move(column))
        : category_candidates(column);

    SplitInfo candidate = best;
    for (Float value : candidates) {
        candidate.value = value;
        Float score = score_candidate(dataset, rows, feature, candidate);
        if (score == INF) {
            continue;
        }
        // Non-negative gain is required independently of any pruning threshold
        if (score < best.score && parent_impurity - score >= 0.0) {
            best.value = value;
            best.score = score;
            best.is_valid = true;
        }
    }

    return best;
}

SplitInfo SplitFinder::find_best_split(
    const Dataset& dataset,
    const std::vector<Index>& rows,
    const std::vector<FeatureIndex>& features,
    Float parent_impurity
) const {
    SplitInfo best;

    for (FeatureIndex feature : features) {
        SplitInfo split = find_feature_split(dataset, rows, feature, parent_impurity);
        if (split.is_valid && (!best.is_valid || split.score < best.score)) {
            best = split;
        }
    }

    return best;
}

void SplitFinder::partition(
    const Dataset& dataset,
    const std::vector<Index>& rows,
    const SplitInfo& split,
    std::vector<Index>& left,
    std::vector<Index>& right
) {
    left.clear();
    right.clear();
    left.reserve(rows.size());
    right.reserve(rows.size());

    for (Index row : rows) {
        if (split.goes_left(dataset.value(row, split.feature))) {
            left.push_back(row);
        } else {
            right.push_back(row);
        }
    }
}

} // namespace canopy
