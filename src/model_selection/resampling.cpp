/**
 * Canopy Resampling Implementation
 */

#include "canopy/resampling.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

namespace canopy {

TrainTestIndices stratified_split(
    const LabelVector& strata,
    Float test_fraction,
    uint64_t seed
) {
    if (!(test_fraction > 0.0 && test_fraction < 1.0)) {
        throw std::invalid_argument("test_fraction must be in (0, 1)");
    }

    // Row indices per stratum, strata in ascending order
    std::map<Label, std::vector<Index>> groups;
    for (size_t i = 0; i < strata.size(); ++i) {
        groups[strata[i]].push_back(static_cast<Index>(i));
    }

    std::mt19937_64 rng(seed);
    TrainTestIndices result;
    result.train.reserve(strata.size());
    result.test.reserve(strata.size());

    for (auto& [stratum, rows] : groups) {
        std::shuffle(rows.begin(), rows.end(), rng);
        // Every stratum keeps at least one training row
        size_t n_test = static_cast<size_t>(std::llround(test_fraction * rows.size()));
        n_test = std::min(n_test, rows.size() - 1);

        result.test.insert(result.test.end(), rows.begin(), rows.begin() + n_test);
        result.train.insert(result.train.end(), rows.begin() + n_test, rows.end());
    }

    std::shuffle(result.train.begin(), result.train.end(), rng);
    std::shuffle(result.test.begin(), result.test.end(), rng);
    return result;
}

std::pair<Dataset, Dataset> train_test_split(
    const Dataset& dataset,
    Float test_fraction,
    uint64_t seed
) {
    TrainTestIndices split = stratified_split(dataset.labels(), test_fraction, seed);
    return {dataset.subset(split.train), dataset.subset(split.test)};
}

// ============================================================================
// K-Fold
// ============================================================================

KFold::KFold(uint32_t n_splits, bool shuffle, uint64_t seed)
    : n_splits_(n_splits), shuffle_(shuffle), seed_(seed) {
    if (n_splits_ < 2) {
        throw std::invalid_argument("KFold requires at least 2 splits, got " +
                                    std::to_string(n_splits_));
    }
}

std::vector<Fold> KFold::split(Index n_samples) const {
    if (n_splits_ > n_samples) {
        throw std::invalid_argument("cannot make " + std::to_string(n_splits_) +
                                    " folds from " + std::to_string(n_samples) + " rows");
    }

    std::vector<Index> indices(n_samples);
    std::iota(indices.begin(), indices.end(), static_cast<Index>(0));
    if (shuffle_) {
        std::mt19937_64 rng(seed_);
        std::shuffle(indices.begin(), indices.end(), rng);
    }

    const Index base = n_samples / n_splits_;
    const Index extra = n_samples % n_splits_;

    std::vector<Fold> folds(n_splits_);
    Index start = 0;
    for (uint32_t k = 0; k < n_splits_; ++k) {
        const Index size = base + (k < extra ? 1 : 0);
        const Index stop = start + size;

        Fold& fold = folds[k];
        fold.validation.assign(indices.begin() + start, indices.begin() + stop);
        fold.train.reserve(n_samples - size);
        fold.train.insert(fold.train.end(), indices.begin(), indices.begin() + start);
        fold.train.insert(fold.train.end(), indices.begin() + stop, indices.end());

        start = stop;
    }
    return folds;
}

} // namespace canopy
