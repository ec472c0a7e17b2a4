/**
 * Canopy Dataset Implementation
 */

#include "canopy/dataset.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace canopy {

Dataset::Dataset(Matrix features, LabelVector labels, std::vector<FeatureKind> kinds)
    : features_(std::move(features)), labels_(std::move(labels)), kinds_(std::move(kinds)) {
    if (kinds_.empty()) {
        kinds_.assign(static_cast<size_t>(features_.cols()), FeatureKind::Ordered);
    }
    validate();
}

Dataset Dataset::from_dense(
    const Float* data,
    Index n_samples,
    FeatureIndex n_features,
    const Label* labels,
    const std::vector<FeatureIndex>& unordered_features
) {
    if (n_samples > 0 && (data == nullptr || labels == nullptr)) {
        throw std::invalid_argument("from_dense: data and labels must not be null");
    }

    Matrix features(n_samples, n_features);
    if (n_samples > 0 && n_features > 0) {
        features = Eigen::Map<const Matrix>(data, n_samples, n_features);
    }

    LabelVector label_vec(labels, labels + n_samples);

    std::vector<FeatureKind> kinds(n_features, FeatureKind::Ordered);
    for (FeatureIndex f : unordered_features) {
        if (f >= n_features) {
            throw std::invalid_argument("unordered feature index " + std::to_string(f) +
                                        " out of range for " + std::to_string(n_features) +
                                        " features");
        }
        kinds[f] = FeatureKind::Unordered;
    }

    return Dataset(std::move(features), std::move(label_vec), std::move(kinds));
}

void Dataset::validate() const {
    if (static_cast<size_t>(features_.rows()) != labels_.size()) {
        throw std::invalid_argument("row count mismatch: matrix has " +
                                    std::to_string(features_.rows()) + " rows but " +
                                    std::to_string(labels_.size()) + " labels were given");
    }
    if (static_cast<size_t>(features_.cols()) != kinds_.size()) {
        throw std::invalid_argument("column count mismatch: matrix has " +
                                    std::to_string(features_.cols()) + " columns but " +
                                    std::to_string(kinds_.size()) + " feature kinds were given");
    }
    for (size_t i = 0; i < labels_.size(); ++i) {
        if (labels_[i] < 0) {
            throw std::invalid_argument("label at row " + std::to_string(i) +
                                        " is negative (" + std::to_string(labels_[i]) + ")");
        }
    }
}

Dataset Dataset::subset(const std::vector<Index>& rows) const {
    Matrix features(static_cast<Eigen::Index>(rows.size()), features_.cols());
    LabelVector labels(rows.size());

    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i] >= n_samples()) {
            throw std::invalid_argument("subset row " + std::to_string(rows[i]) +
                                        " out of range");
        }
        features.row(static_cast<Eigen::Index>(i)) = features_.row(rows[i]);
        labels[i] = labels_[rows[i]];
    }

    return Dataset(std::move(features), std::move(labels), kinds_);
}

LabelVector Dataset::classes() const {
    LabelVector classes = labels_;
    std::sort(classes.begin(), classes.end());
    classes.erase(std::unique(classes.begin(), classes.end()), classes.end());
    return classes;
}

} // namespace canopy
