/**
 * Canopy Tree Implementation
 */

#include "canopy/tree.hpp"
#include <algorithm>
#include <cstdio>
#include <numeric>
#include <stdexcept>
#include <string>

namespace canopy {

// ============================================================================
// Decision Tree
// ============================================================================

DecisionTree::DecisionTree(const TreeConfig& config) : config_(config) {
    config_.validate();
}

void DecisionTree::fit(const Dataset& dataset) {
    std::vector<Index> rows(dataset.n_samples());
    std::iota(rows.begin(), rows.end(), static_cast<Index>(0));
    fit(dataset, rows);
}

void DecisionTree::fit(const Dataset& dataset, const std::vector<Index>& rows) {
    config_.validate();

    if (rows.empty()) {
        throw std::invalid_argument("cannot fit a tree on an empty dataset");
    }
    if (dataset.n_features() == 0) {
        throw std::invalid_argument("cannot fit a tree on a dataset without features");
    }
    for (Index row : rows) {
        if (row >= dataset.n_samples()) {
            throw std::invalid_argument("row index " + std::to_string(row) +
                                        " out of range for " +
                                        std::to_string(dataset.n_samples()) + " samples");
        }
    }

    GrowContext ctx{
        dataset,
        SplitFinder(config_.criterion, config_.max_candidates),
        std::mt19937_64(config_.seed),
        std::vector<Float>(dataset.n_features(), 0.0)
    };

    std::unique_ptr<Node> root = grow(ctx, rows, 0);

    // Normalize importances; no split leaves them all zero
    Float total = std::accumulate(ctx.importance.begin(), ctx.importance.end(), 0.0);
    if (total > 0.0) {
        for (auto& v : ctx.importance) {
            v /= total;
        }
    }

    // Commit only once growth has succeeded
    root_ = std::move(root);
    importances_ = std::move(ctx.importance);
    n_features_ = dataset.n_features();
    depth_ = ctx.depth;
    n_nodes_ = ctx.n_nodes;
    n_leaves_ = ctx.n_leaves;

    if (config_.verbosity > 1) {
        std::printf("[DEBUG] tree fit: n_samples=%zu, n_features=%u, depth=%u, n_nodes=%u, n_leaves=%u\n",
                    rows.size(), n_features_, depth_, n_nodes_, n_leaves_);
    }
}

std::vector<FeatureIndex> DecisionTree::active_features(GrowContext& ctx) const {
    const FeatureIndex n = ctx.dataset.n_features();
    std::vector<FeatureIndex> features(n);
    std::iota(features.begin(), features.end(), static_cast<FeatureIndex>(0));

    if (!config_.max_features.subsamples()) {
        return features;
    }

    // Partial Fisher-Yates: first k slots become a draw without replacement
    const FeatureIndex k = config_.max_features.resolve(n);
    for (FeatureIndex i = 0; i < k; ++i) {
        std::uniform_int_distribution<FeatureIndex> pick(i, n - 1);
        std::swap(features[i], features[pick(ctx.rng)]);
    }
    features.resize(k);
    return features;
}

std::unique_ptr<Node> DecisionTree::grow(
    GrowContext& ctx,
    const std::vector<Index>& rows,
    uint32_t depth
) const {
    auto node = std::make_unique<Node>();
    ++ctx.n_nodes;
    ctx.depth = std::max(ctx.depth, depth);

    ClassCounts counts = ClassCounts::of(ctx.dataset.labels(), rows);
    const Float impurity = ctx.finder.criterion()(counts);

    node->depth = depth;
    node->n_samples = static_cast<Index>(rows.size());
    node->impurity = impurity;
    node->prediction = counts.majority();

    bool should_stop =
        (config_.max_depth.has_value() && depth >= *config_.max_depth) ||
        rows.size() < config_.min_samples_split ||
        counts.n_classes() <= 1;

    if (should_stop) {
        ++ctx.n_leaves;
        return node;
    }

    std::vector<FeatureIndex> features = active_features(ctx);
    SplitInfo best_split = ctx.finder.find_best_split(ctx.dataset, rows, features, impurity);

    if (!best_split.is_valid) {
        ++ctx.n_leaves;
        return node;
    }

    // Pre-pruning: the split is discarded, not applied
    const Float gain = impurity - best_split.score;
    if (gain < config_.min_impurity_decrease) {
        ++ctx.n_leaves;
        return node;
    }

    node->is_leaf = false;
    node->feature = best_split.feature;
    node->kind = best_split.kind;
    node->value = best_split.value;
    node->gain = gain;
    ctx.importance[best_split.feature] += gain;

    std::vector<Index> left_rows, right_rows;
    SplitFinder::partition(ctx.dataset, rows, best_split, left_rows, right_rows);

    node->left = grow(ctx, left_rows, depth + 1);
    node->right = grow(ctx, right_rows, depth + 1);
    return node;
}

// ============================================================================
// Prediction
// ============================================================================

void DecisionTree::check_fitted() const {
    if (!root_) {
        throw std::runtime_error("DecisionTree not fitted. Call fit() first.");
    }
}

Label DecisionTree::predict_one(const Float* features, FeatureIndex n_features) const {
    check_fitted();
    if (n_features != n_features_) {
        throw std::invalid_argument("expected " + std::to_string(n_features_) +
                                    " features, got " + std::to_string(n_features));
    }

    const Node* node = root_.get();
    while (!node->is_leaf) {
        node = node->goes_left(features) ? node->left.get() : node->right.get();
    }
    return node->prediction;
}

LabelVector DecisionTree::predict(const Matrix& X) const {
    check_fitted();
    const FeatureIndex n_features = static_cast<FeatureIndex>(X.cols());
    if (n_features != n_features_) {
        throw std::invalid_argument("expected " + std::to_string(n_features_) +
                                    " features, got " + std::to_string(n_features));
    }

    LabelVector output(static_cast<size_t>(X.rows()));
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        output[static_cast<size_t>(i)] = predict_one(X.data() + i * X.cols(), n_features);
    }
    return output;
}

// ============================================================================
// Introspection
// ============================================================================

ModelComplexity DecisionTree::complexity() const {
    ModelComplexity c;
    c.depth = static_cast<Float>(depth_);
    c.n_nodes = static_cast<Float>(n_nodes_);
    return c;
}

void DecisionTree::set_param(const std::string& name, const ParamValue& value) {
    if (!apply_tree_param(config_, name, value)) {
        throw std::invalid_argument("unknown tree parameter '" + name + "'");
    }
}

namespace {

int32_t flatten_into(const Node* node, std::vector<FlatNode>& out) {
    const int32_t idx = static_cast<int32_t>(out.size());

    FlatNode flat;
    flat.is_leaf = node->is_leaf;
    flat.feature = node->feature;
    flat.kind = node->kind;
    flat.value = node->value;
    flat.prediction = node->prediction;
    flat.depth = node->depth;
    flat.gain = node->gain;
    flat.impurity = node->impurity;
    flat.n_samples = node->n_samples;
    out.push_back(flat);

    if (!node->is_leaf) {
        int32_t left = flatten_into(node->left.get(), out);
        int32_t right = flatten_into(node->right.get(), out);
        out[idx].left = left;
        out[idx].right = right;
    }
    return idx;
}

} // namespace

std::vector<FlatNode> DecisionTree::flatten() const {
    std::vector<FlatNode> nodes;
    if (root_) {
        nodes.reserve(n_nodes_);
        flatten_into(root_.get(), nodes);
    }
    return nodes;
}

} // namespace canopy
