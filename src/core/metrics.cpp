/**
 * Canopy Metrics Implementation
 */

#include "canopy/metrics.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace canopy {

// ============================================================================
// Confusion Matrix
// ============================================================================

int64_t ConfusionMatrix::index_of(Label label) const {
    auto it = std::lower_bound(labels.begin(), labels.end(), label);
    if (it == labels.end() || *it != label) return -1;
    return static_cast<int64_t>(it - labels.begin());
}

Index ConfusionMatrix::at(Label true_label, Label predicted_label) const {
    const int64_t t = index_of(true_label);
    const int64_t p = index_of(predicted_label);
    if (t < 0 || p < 0) {
        throw std::invalid_argument("label not present in confusion matrix");
    }
    return counts[static_cast<size_t>(t)][static_cast<size_t>(p)];
}

// ============================================================================
// Metrics
// ============================================================================

void Metrics::check_inputs(const LabelVector& y_true, const LabelVector& y_pred) {
    if (y_true.size() != y_pred.size()) {
        throw std::invalid_argument("y_true and y_pred must have same size");
    }
    if (y_true.empty()) {
        throw std::invalid_argument("y_true and y_pred must not be empty");
    }
}

Float Metrics::accuracy(const LabelVector& y_true, const LabelVector& y_pred) {
    check_inputs(y_true, y_pred);

    Index correct = 0;
    for (size_t i = 0; i < y_true.size(); ++i) {
        if (y_true[i] == y_pred[i]) ++correct;
    }
    return static_cast<Float>(correct) / static_cast<Float>(y_true.size());
}

ConfusionMatrix Metrics::confusion_matrix(
    const LabelVector& y_true,
    const LabelVector& y_pred
) {
    check_inputs(y_true, y_pred);

    ConfusionMatrix cm;
    cm.labels.reserve(y_true.size() + y_pred.size());
    cm.labels.insert(cm.labels.end(), y_true.begin(), y_true.end());
    cm.labels.insert(cm.labels.end(), y_pred.begin(), y_pred.end());
    std::sort(cm.labels.begin(), cm.labels.end());
    cm.labels.erase(std::unique(cm.labels.begin(), cm.labels.end()), cm.labels.end());

    const size_t n = cm.labels.size();
    cm.counts.assign(n, std::vector<Index>(n, 0));
    for (size_t i = 0; i < y_true.size(); ++i) {
        const auto t = static_cast<size_t>(cm.index_of(y_true[i]));
        const auto p = static_cast<size_t>(cm.index_of(y_pred[i]));
        ++cm.counts[t][p];
    }
    return cm;
}

ClassificationReport Metrics::classification_report(
    const LabelVector& y_true,
    const LabelVector& y_pred
) {
    const ConfusionMatrix cm = confusion_matrix(y_true, y_pred);
    const size_t n = cm.n_labels();

    ClassificationReport report;
    report.classes.reserve(n);

    Index total_support = 0;
    Index correct = 0;

    for (size_t k = 0; k < n; ++k) {
        Index tp = cm.counts[k][k];
        Index predicted = 0;
        Index actual = 0;
        for (size_t j = 0; j < n; ++j) {
            predicted += cm.counts[j][k];
            actual += cm.counts[k][j];
        }

        ClassReport row;
        row.label = cm.labels[k];
        row.precision = predicted > 0 ? static_cast<Float>(tp) / predicted : 0.0;
        row.recall = actual > 0 ? static_cast<Float>(tp) / actual : 0.0;
        row.f1 = (row.precision + row.recall > 0)
            ? 2.0 * row.precision * row.recall / (row.precision + row.recall)
            : 0.0;
        row.support = actual;

        report.classes.push_back(row);
        total_support += actual;
        correct += tp;
    }

    ClassReport& avg = report.weighted_avg;
    avg.support = total_support;
    for (const auto& row : report.classes) {
        const Float w = static_cast<Float>(row.support) / total_support;
        avg.precision += w * row.precision;
        avg.recall += w * row.recall;
        avg.f1 += w * row.f1;
    }

    report.accuracy = static_cast<Float>(correct) / total_support;
    return report;
}

std::string ClassificationReport::to_string() const {
    std::string out;
    char line[128];

    std::snprintf(line, sizeof(line), "%12s %10s %10s %10s %10s\n",
                  "label", "precision", "recall", "f1-score", "support");
    out += line;
    for (const auto& row : classes) {
        std::snprintf(line, sizeof(line), "%12d %10.3f %10.3f %10.3f %10u\n",
                      row.label, row.precision, row.recall, row.f1, row.support);
        out += line;
    }
    std::snprintf(line, sizeof(line), "%12s %10s %10s %10.3f %10u\n",
                  "accuracy", "", "", accuracy, weighted_avg.support);
    out += line;
    std::snprintf(line, sizeof(line), "%12s %10.3f %10.3f %10.3f %10u\n",
                  "weighted avg", weighted_avg.precision, weighted_avg.recall,
                  weighted_avg.f1, weighted_avg.support);
    out += line;
    return out;
}

} // namespace canopy
