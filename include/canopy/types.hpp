#pragma once

/**
 * Canopy: Decision Trees, Forests and Cross-Validated Search
 *
 * Core type definitions shared by every component:
 * - Dense row-major feature matrix (Eigen)
 * - Integer class labels
 * - Per-column feature kind (ordered / unordered)
 */

#include <cstdint>
#include <cstddef>
#include <cmath>
#include <vector>
#include <limits>

#include <Eigen/Core>

namespace canopy {

// ============================================================================
// Basic Types
// ============================================================================

using Float = double;                   // Feature values, impurities, scores
using Index = uint32_t;                 // Row indices and counts
using FeatureIndex = uint32_t;          // Column indices
using Label = int32_t;                  // Class labels (non-negative)

using Matrix = Eigen::Matrix<Float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using LabelVector = std::vector<Label>;

constexpr Float INF = std::numeric_limits<Float>::infinity();

// ============================================================================
// Feature Metadata
// ============================================================================

enum class FeatureKind : uint8_t {
    Ordered = 0,       // Numeric, split by value <= threshold
    Unordered = 1,     // Categorical code, split by value == category
};

// ============================================================================
// Split Criterion
// ============================================================================

enum class Criterion : uint8_t {
    Gini = 0,          // 2p(1-p) for two classes, 1 - sum p^2 otherwise
    Entropy = 1,       // Shannon entropy (base 2), halved
    Error = 2,         // Misclassification error
    Sqrt = 3,          // sqrt(p(1-p)) of the first observed class
};

// ============================================================================
// Model Complexity
// ============================================================================

// Depth and size of a fitted model; means over members for an ensemble.
struct ModelComplexity {
    Float depth = 0;
    Float n_nodes = 0;
};

} // namespace canopy
