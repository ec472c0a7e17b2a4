#pragma once

/**
 * Canopy Configuration
 *
 * Hyperparameter settings for single trees, forests and the cross-validated
 * grid search. Every struct validates itself and throws std::invalid_argument
 * on a bad value instead of silently falling back to a default.
 */

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace canopy {

// Candidate cap for threshold and category search (see SplitFinder)
constexpr Index DEFAULT_MAX_CANDIDATES = 10;

// ============================================================================
// Criterion Names
// ============================================================================

inline Criterion parse_criterion(const std::string& name) {
    if (name == "gini") return Criterion::Gini;
    if (name == "entropy") return Criterion::Entropy;
    if (name == "error") return Criterion::Error;
    if (name == "sqrt") return Criterion::Sqrt;
    throw std::invalid_argument("unknown criterion '" + name +
                                "' (expected gini, entropy, error or sqrt)");
}

inline const char* criterion_name(Criterion criterion) {
    switch (criterion) {
        case Criterion::Gini: return "gini";
        case Criterion::Entropy: return "entropy";
        case Criterion::Error: return "error";
        case Criterion::Sqrt: return "sqrt";
    }
    return "unknown";
}

// ============================================================================
// Feature Subsampling Policy
// ============================================================================

struct MaxFeatures {
    enum class Policy : uint8_t {
        All = 0,        // Every feature at every split
        Count = 1,      // Fixed number of features
        Sqrt = 2,       // floor(sqrt(n_features))
        Log2 = 3,       // floor(log2(n_features))
        Fraction = 4,   // floor(fraction * n_features)
    };

    Policy policy = Policy::All;
    Index count = 0;
    Float fraction = 1.0;

    static MaxFeatures all() { return MaxFeatures{}; }

    static MaxFeatures fixed(Index n) {
        MaxFeatures mf;
        mf.policy = Policy::Count;
        mf.count = n;
        return mf;
    }

    static MaxFeatures sqrt() {
        MaxFeatures mf;
        mf.policy = Policy::Sqrt;
        return mf;
    }

    static MaxFeatures log2() {
        MaxFeatures mf;
        mf.policy = Policy::Log2;
        return mf;
    }

    static MaxFeatures of_fraction(Float f) {
        MaxFeatures mf;
        mf.policy = Policy::Fraction;
        mf.fraction = f;
        return mf;
    }

    static MaxFeatures parse(const std::string& name) {
        if (name == "sqrt") return sqrt();
        if (name == "log2") return log2();
        if (name == "all") return all();
        throw std::invalid_argument("unknown max_features policy '" + name +
                                    "' (expected sqrt, log2 or all)");
    }

    bool subsamples() const { return policy != Policy::All; }

    /**
     * Number of features drawn per split, floored at 1 and capped at n_features
     */
    FeatureIndex resolve(FeatureIndex n_features) const {
        if (n_features == 0) return 0;
        Float raw = static_cast<Float>(n_features);
        switch (policy) {
            case Policy::All: raw = static_cast<Float>(n_features); break;
            case Policy::Count: raw = static_cast<Float>(count); break;
            case Policy::Sqrt: raw = std::floor(std::sqrt(static_cast<Float>(n_features))); break;
            case Policy::Log2: raw = std::floor(std::log2(static_cast<Float>(n_features))); break;
            case Policy::Fraction: raw = std::floor(fraction * n_features); break;
        }
        raw = std::max<Float>(1.0, std::min<Float>(raw, n_features));
        return static_cast<FeatureIndex>(raw);
    }

    void validate() const {
        if (policy == Policy::Count && count < 1) {
            throw std::invalid_argument("max_features count must be at least 1");
        }
        if (policy == Policy::Fraction && !(fraction > 0.0 && fraction <= 1.0)) {
            throw std::invalid_argument("max_features fraction must be in (0, 1]");
        }
    }

    std::string to_string() const {
        switch (policy) {
            case Policy::All: return "all";
            case Policy::Count: return std::to_string(count);
            case Policy::Sqrt: return "sqrt";
            case Policy::Log2: return "log2";
            case Policy::Fraction: return std::to_string(fraction);
        }
        return "unknown";
    }
};

// ============================================================================
// Tree Configuration
// ============================================================================

struct TreeConfig {
    Criterion criterion = Criterion::Gini;
    std::optional<uint32_t> max_depth;         // Unset = grow until pure or too small
    Index min_samples_split = 2;               // Fewer rows than this -> leaf
    Float min_impurity_decrease = 0.0;         // Pruning threshold on split gain
    MaxFeatures max_features;                  // Per-split feature subsampling
    Index max_candidates = DEFAULT_MAX_CANDIDATES;  // Thresholds/categories tried per feature

    uint64_t seed = 42;                        // Feature subsampling source
    int32_t verbosity = 0;                     // 0=silent, 1=progress, 2=debug

    // Preset used for forest members: decorrelate trees by sampling features
    static TreeConfig forest_member() {
        TreeConfig cfg;
        cfg.max_features = MaxFeatures::sqrt();
        return cfg;
    }

    void validate() const {
        if (min_samples_split < 1) {
            throw std::invalid_argument("min_samples_split must be at least 1");
        }
        if (!std::isfinite(min_impurity_decrease)) {
            throw std::invalid_argument("min_impurity_decrease must be finite");
        }
        if (max_candidates < 1) {
            throw std::invalid_argument("max_candidates must be at least 1");
        }
        max_features.validate();
    }
};

// ============================================================================
// Forest Configuration
// ============================================================================

struct ForestConfig {
    uint32_t n_estimators = 100;               // Number of bootstrap trees
    TreeConfig tree = TreeConfig::forest_member();

    uint64_t seed = 42;                        // Root source for member seeds
    int32_t n_threads = -1;                    // -1 = all cores
    int32_t verbosity = 0;

    void validate() const {
        if (n_estimators < 1) {
            throw std::invalid_argument("n_estimators must be at least 1");
        }
        tree.validate();
    }
};

// ============================================================================
// Search Configuration
// ============================================================================

struct SearchConfig {
    uint32_t n_folds = 5;                      // k in k-fold cross-validation
    Float acceptable_accuracy = 0.0;           // Minimum mean accuracy to compete on complexity
    bool shuffle = true;                       // Shuffle rows once before folding
    uint64_t seed = 42;

    int32_t n_threads = -1;
    int32_t verbosity = 1;

    void validate() const {
        if (n_folds < 2) {
            throw std::invalid_argument("n_folds must be at least 2");
        }
        if (std::isnan(acceptable_accuracy)) {
            throw std::invalid_argument("acceptable_accuracy must not be NaN");
        }
    }
};

} // namespace canopy
