#pragma once

/**
 * Canopy: Decision Trees, Random Forests and Cross-Validated Grid Search
 *
 * Binary-split classification trees over mixed ordered/unordered features,
 * bagged forests of such trees, and a k-fold grid search that picks the most
 * accurate and then the simplest hyperparameter combination.
 *
 * Usage:
 * ```cpp
 * #include <canopy/canopy.hpp>
 *
 * canopy::Dataset data(X, y, kinds);
 *
 * canopy::TreeConfig config;
 * config.criterion = canopy::Criterion::Entropy;
 * config.max_depth = 6;
 *
 * canopy::DecisionTree tree(config);
 * tree.fit(data);
 * canopy::LabelVector predicted = tree.predict(X_test);
 * ```
 *
 * Hyperparameter search:
 * ```cpp
 * canopy::ParamGrid grid = {
 *     {"max_depth", {int64_t{3}, int64_t{5}, canopy::ParamValue{}}},
 *     {"criterion", {std::string("gini"), std::string("entropy")}},
 * };
 * canopy::GridSearch search(
 *     [] { return std::make_unique<canopy::DecisionTree>(); }, grid);
 * canopy::SearchOutcome outcome = search.run(data);
 * ```
 */

#define CANOPY_VERSION_MAJOR 0
#define CANOPY_VERSION_MINOR 1
#define CANOPY_VERSION_PATCH 0
#define CANOPY_VERSION_STRING "0.1.0"

#include "canopy/types.hpp"
#include "canopy/config.hpp"
#include "canopy/dataset.hpp"
#include "canopy/criterion.hpp"
#include "canopy/split_finder.hpp"
#include "canopy/tree.hpp"
#include "canopy/forest.hpp"
#include "canopy/params.hpp"
#include "canopy/metrics.hpp"
#include "canopy/resampling.hpp"
#include "canopy/search.hpp"
#include <cstdio>

namespace canopy {

/**
 * Library version information
 */
struct Version {
    static constexpr int major = CANOPY_VERSION_MAJOR;
    static constexpr int minor = CANOPY_VERSION_MINOR;
    static constexpr int patch = CANOPY_VERSION_PATCH;
    static constexpr const char* string = CANOPY_VERSION_STRING;
};

/**
 * Get compile-time feature flags
 */
struct CompileFeatures {
    static constexpr bool has_openmp =
        #ifdef _OPENMP
            true;
        #else
            false;
        #endif
};

/**
 * Print library info
 */
inline void print_info() {
    std::printf("Canopy v%s\n", Version::string);
    std::printf("  OpenMP: %s\n", CompileFeatures::has_openmp ? "Yes" : "No");
}

} // namespace canopy
