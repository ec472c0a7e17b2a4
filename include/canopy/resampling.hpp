#pragma once

/**
 * Canopy Resampling
 *
 * Stratified train/test split and k-fold partitioning of row indices.
 * Both are deterministic for a given seed (std::mt19937_64).
 */

#include "types.hpp"
#include "dataset.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace canopy {

struct TrainTestIndices {
    std::vector<Index> train;
    std::vector<Index> test;
};

/**
 * Per-stratum shuffle, then round(test_fraction * stratum size) rows of each
 * stratum go to test, capped so that every stratum keeps at least one
 * training row. Both sides are reshuffled afterwards.
 * @param strata One stratum value per row (usually the labels)
 * @param test_fraction In (0, 1)
 */
TrainTestIndices stratified_split(
    const LabelVector& strata,
    Float test_fraction,
    uint64_t seed = 42
);

/**
 * Stratified on the dataset labels; returns (train, test)
 */
std::pair<Dataset, Dataset> train_test_split(
    const Dataset& dataset,
    Float test_fraction,
    uint64_t seed = 42
);

// ============================================================================
// K-Fold
// ============================================================================

struct Fold {
    std::vector<Index> train;
    std::vector<Index> validation;
};

class KFold {
public:
    explicit KFold(uint32_t n_splits = 5, bool shuffle = false, uint64_t seed = 42);

    /**
     * k contiguous blocks of the (optionally shuffled) index list; the first
     * n % k blocks get one extra row. Train sides keep the relative order of
     * the remaining indices.
     */
    std::vector<Fold> split(Index n_samples) const;

    uint32_t n_splits() const { return n_splits_; }

private:
    uint32_t n_splits_;
    bool shuffle_;
    uint64_t seed_;
};

} // namespace canopy
