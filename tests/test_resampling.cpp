/**
 * Canopy Resampling Tests
 */

#include <gtest/gtest.h>
#include "canopy/resampling.hpp"
#include <algorithm>
#include <map>
#include <set>

using namespace canopy;

TEST(KFoldTest, PartitionCoversAllRows) {
    for (Index n : {10u, 11u, 17u, 100u}) {
        for (uint32_t k : {2u, 3u, 5u, 7u}) {
            KFold kfold(k, true, 3);
            auto folds = kfold.split(n);
            ASSERT_EQ(folds.size(), k);

            std::set<Index> seen;
            size_t total = 0;
            size_t min_size = n, max_size = 0;
            for (const auto& fold : folds) {
                total += fold.validation.size();
                min_size = std::min(min_size, fold.validation.size());
                max_size = std::max(max_size, fold.validation.size());
                seen.insert(fold.validation.begin(), fold.validation.end());
                EXPECT_EQ(fold.train.size() + fold.validation.size(), n);
            }

            EXPECT_EQ(total, n);
            EXPECT_EQ(seen.size(), n);
            EXPECT_LE(max_size - min_size, 1u);
        }
    }
}

TEST(KFoldTest, UnshuffledBlocks) {
    KFold kfold(3);
    auto folds = kfold.split(7);

    EXPECT_EQ(folds[0].validation, (std::vector<Index>{0, 1, 2}));
    EXPECT_EQ(folds[1].validation, (std::vector<Index>{3, 4}));
    EXPECT_EQ(folds[2].validation, (std::vector<Index>{5, 6}));
    EXPECT_EQ(folds[1].train, (std::vector<Index>{0, 1, 2, 5, 6}));
}

TEST(KFoldTest, ShuffleIsDeterministic) {
    auto a = KFold(4, true, 99).split(20);
    auto b = KFold(4, true, 99).split(20);
    for (size_t k = 0; k < a.size(); ++k) {
        EXPECT_EQ(a[k].validation, b[k].validation);
    }
}

TEST(KFoldTest, RejectsBadFoldCounts) {
    EXPECT_THROW(KFold(1), std::invalid_argument);
    EXPECT_THROW(KFold(5).split(4), std::invalid_argument);
    EXPECT_NO_THROW(KFold(4).split(4));
}

TEST(StratifiedSplitTest, PreservesProportions) {
    LabelVector labels;
    for (int i = 0; i < 60; ++i) labels.push_back(0);
    for (int i = 0; i < 30; ++i) labels.push_back(1);
    for (int i = 0; i < 10; ++i) labels.push_back(2);

    auto split = stratified_split(labels, 0.2, 7);

    std::map<Label, size_t> test_counts, train_counts;
    for (Index i : split.test) ++test_counts[labels[i]];
    for (Index i : split.train) ++train_counts[labels[i]];

    EXPECT_EQ(test_counts[0], 12u);
    EXPECT_EQ(test_counts[1], 6u);
    EXPECT_EQ(test_counts[2], 2u);
    EXPECT_EQ(train_counts[0], 48u);
    EXPECT_EQ(train_counts[1], 24u);
    EXPECT_EQ(train_counts[2], 8u);

    std::set<Index> all(split.train.begin(), split.train.end());
    all.insert(split.test.begin(), split.test.end());
    EXPECT_EQ(all.size(), labels.size());
}

TEST(StratifiedSplitTest, Deterministic) {
    LabelVector labels = {0, 1, 0, 1, 0, 1, 0, 1, 1, 1};
    auto a = stratified_split(labels, 0.3, 5);
    auto b = stratified_split(labels, 0.3, 5);
    EXPECT_EQ(a.train, b.train);
    EXPECT_EQ(a.test, b.test);
}

TEST(StratifiedSplitTest, RareClassStaysInTrain) {
    LabelVector labels = {0, 0, 0, 0, 0, 0, 0, 0, 0, 1};
    auto split = stratified_split(labels, 0.5, 11);

    EXPECT_EQ(split.train.size(), 5u);
    EXPECT_EQ(split.test.size(), 5u);

    size_t ones_in_train = std::count_if(split.train.begin(), split.train.end(),
                                         [&](Index i) { return labels[i] == 1; });
    EXPECT_EQ(ones_in_train, 1u);
}

TEST(StratifiedSplitTest, RejectsBadFraction) {
    LabelVector labels = {0, 1};
    EXPECT_THROW(stratified_split(labels, 0.0), std::invalid_argument);
    EXPECT_THROW(stratified_split(labels, 1.0), std::invalid_argument);
}

TEST(TrainTestSplitTest, SplitsDataset) {
    Matrix X(10, 1);
    for (Index i = 0; i < 10; ++i) X(i, 0) = i;
    Dataset ds(X, {0, 0, 0, 0, 0, 1, 1, 1, 1, 1});

    auto [train, test] = train_test_split(ds, 0.4, 1);
    EXPECT_EQ(train.n_samples(), 6u);
    EXPECT_EQ(test.n_samples(), 4u);

    // Rows travel with their labels
    for (Index i = 0; i < test.n_samples(); ++i) {
        EXPECT_EQ(test.label(i), test.value(i, 0) < 5 ? 0 : 1);
    }
}
