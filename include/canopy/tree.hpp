#pragma once

/**
 * Canopy Decision Tree
 *
 * Binary classification tree grown by recursive best-split partitioning.
 * At every node, in order:
 *   1. leaf if depth >= max_depth, rows < min_samples_split, or the rows are pure
 *   2. search the best split over all features or a random feature subset
 *   3. leaf if no admissible split exists
 *   4. leaf if the split gain is below min_impurity_decrease
 *   5. otherwise split, credit the gain to the feature, and recurse
 *
 * Leaves predict the majority label of their training rows (ties to the
 * smallest label). Each node exclusively owns its children.
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "criterion.hpp"
#include "split_finder.hpp"
#include "classifier.hpp"
#include <memory>
#include <random>
#include <vector>

namespace canopy {

// ============================================================================
// Tree Node
// ============================================================================

struct Node {
    bool is_leaf = true;
    uint32_t depth = 0;
    Index n_samples = 0;                 // Training rows reaching this node
    Float impurity = 0.0;

    // Majority label of the training rows; the prediction of a leaf
    Label prediction = 0;

    // Split (internal nodes only)
    FeatureIndex feature = 0;
    FeatureKind kind = FeatureKind::Ordered;
    Float value = 0.0;                   // Threshold or category
    Float gain = 0.0;                    // Impurity decrease at creation
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;

    bool goes_left(const Float* features) const {
        const Float x = features[feature];
        return kind == FeatureKind::Ordered ? x <= value : x == value;
    }
};

// Pre-order export record; children referenced by position, -1 for none
struct FlatNode {
    bool is_leaf = true;
    FeatureIndex feature = 0;
    FeatureKind kind = FeatureKind::Ordered;
    Float value = 0.0;
    Label prediction = 0;
    uint32_t depth = 0;
    Float gain = 0.0;
    Float impurity = 0.0;
    Index n_samples = 0;
    int32_t left = -1;
    int32_t right = -1;
};

// ============================================================================
// Decision Tree
// ============================================================================

class DecisionTree : public Classifier {
public:
    DecisionTree() = default;
    explicit DecisionTree(const TreeConfig& config);

    DecisionTree(DecisionTree&&) = default;
    DecisionTree& operator=(DecisionTree&&) = default;

    // Disable copy (owns its node tree)
    DecisionTree(const DecisionTree&) = delete;
    DecisionTree& operator=(const DecisionTree&) = delete;

    void fit(const Dataset& dataset) override;

    /**
     * Fit on a multiset of dataset rows (bootstrap samples repeat rows)
     */
    void fit(const Dataset& dataset, const std::vector<Index>& rows);

    Label predict_one(const Float* features, FeatureIndex n_features) const;
    LabelVector predict(const Matrix& X) const override;

    std::vector<Float> feature_importances() const override { return importances_; }
    ModelComplexity complexity() const override;
    void set_param(const std::string& name, const ParamValue& value) override;

    bool is_fitted() const override { return root_ != nullptr; }
    FeatureIndex n_features() const override { return n_features_; }

    // Access tree structure
    const Node* root() const { return root_.get(); }
    uint32_t depth() const { return depth_; }
    Index n_nodes() const { return n_nodes_; }
    Index n_leaves() const { return n_leaves_; }

    std::vector<FlatNode> flatten() const;

    const TreeConfig& config() const { return config_; }

private:
    TreeConfig config_;
    std::unique_ptr<Node> root_;
    std::vector<Float> importances_;
    FeatureIndex n_features_ = 0;
    uint32_t depth_ = 0;
    Index n_nodes_ = 0;
    Index n_leaves_ = 0;

    // Scratch state of one fit() call
    struct GrowContext {
        const Dataset& dataset;
        SplitFinder finder;
        std::mt19937_64 rng;
        std::vector<Float> importance;
        uint32_t depth = 0;
        Index n_nodes = 0;
        Index n_leaves = 0;
    };

    std::unique_ptr<Node> grow(GrowContext& ctx, const std::vector<Index>& rows, uint32_t depth) const;
    std::vector<FeatureIndex> active_features(GrowContext& ctx) const;
    void check_fitted() const;
};

} // namespace canopy
