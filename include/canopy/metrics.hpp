#pragma once

/**
 * Canopy: Evaluation Metrics
 *
 * Multi-class label metrics:
 * - Accuracy: mean of exact label matches
 * - Confusion matrix over the sorted union of true and predicted labels
 * - Per-label precision, recall, F1 and support with a weighted average row
 */

#include "types.hpp"
#include <string>
#include <vector>

namespace canopy {

// ============================================================================
// Confusion Matrix
// ============================================================================

struct ConfusionMatrix {
    LabelVector labels;                    // Sorted distinct labels
    std::vector<std::vector<Index>> counts;  // counts[true_idx][pred_idx]

    size_t n_labels() const { return labels.size(); }

    /**
     * Count of rows with the given true and predicted label.
     * Throws std::invalid_argument for a label outside the matrix.
     */
    Index at(Label true_label, Label predicted_label) const;

    // Position of a label in labels, or -1
    int64_t index_of(Label label) const;
};

// ============================================================================
// Classification Report
// ============================================================================

struct ClassReport {
    Label label = 0;
    Float precision = 0.0;
    Float recall = 0.0;
    Float f1 = 0.0;
    Index support = 0;
};

struct ClassificationReport {
    std::vector<ClassReport> classes;  // One row per label, sorted
    ClassReport weighted_avg;          // Support-weighted; label unused
    Float accuracy = 0.0;

    std::string to_string() const;
};

// ============================================================================
// Metrics Class
// ============================================================================

class Metrics {
public:
    static Float accuracy(const LabelVector& y_true, const LabelVector& y_pred);

    static ConfusionMatrix confusion_matrix(
        const LabelVector& y_true,
        const LabelVector& y_pred
    );

    static ClassificationReport classification_report(
        const LabelVector& y_true,
        const LabelVector& y_pred
    );

private:
    static void check_inputs(const LabelVector& y_true, const LabelVector& y_pred);
};

} // namespace canopy
