/**
 * Canopy Split Search Tests
 */

#include <gtest/gtest.h>
#include "canopy/split_finder.hpp"
#include <numeric>

using namespace canopy;

namespace {

std::vector<Index> all_rows(const Dataset& ds) {
    std::vector<Index> rows(ds.n_samples());
    std::iota(rows.begin(), rows.end(), 0u);
    return rows;
}

} // namespace

TEST(SplitFinderTest, ThresholdCandidatesBelowCap) {
    SplitFinder finder(Criterion::Gini);
    auto thresholds = finder.threshold_candidates({3, 1, 2, 3, 1});
    EXPECT_EQ(thresholds, (std::vector<Float>{1, 2, 3}));
}

TEST(SplitFinderTest, ThresholdCandidatesArePercentiles) {
    SplitFinder finder(Criterion::Gini, 3);

    // Percentiles 0, 50, 100 of 0..10
    std::vector<Float> values(11);
    std::iota(values.begin(), values.end(), 0.0);
    auto thresholds = finder.threshold_candidates(values);
    EXPECT_EQ(thresholds, (std::vector<Float>{0, 5, 10}));

    // Interpolated: median of {0,1,2,3} is 1.5
    SplitFinder pair_finder(Criterion::Gini, 3);
    auto interp = pair_finder.threshold_candidates({3, 0, 2, 1});
    EXPECT_EQ(interp, (std::vector<Float>{0, 1.5, 3}));
}

TEST(SplitFinderTest, CategoryCandidates) {
    SplitFinder finder(Criterion::Gini, 2);

    // Ascending when within the cap
    SplitFinder wide(Criterion::Gini);
    EXPECT_EQ(wide.category_candidates({7, 2, 7, 5}), (std::vector<Float>{2, 5, 7}));

    // Most frequent first, ties to the smaller category
    EXPECT_EQ(finder.category_candidates({9, 4, 9, 4, 1, 9}), (std::vector<Float>{9, 4}));
    EXPECT_EQ(finder.category_candidates({3, 1, 2}), (std::vector<Float>{1, 2}));
}

TEST(SplitFinderTest, OrderedPerfectSplit) {
    Matrix X(6, 1);
    X << 1, 2, 3, 4, 5, 6;
    Dataset ds(X, {0, 0, 0, 1, 1, 1});

    SplitFinder finder(Criterion::Gini);
    auto split = finder.find_feature_split(ds, all_rows(ds), 0, 0.5);

    ASSERT_TRUE(split.is_valid);
    EXPECT_EQ(split.kind, FeatureKind::Ordered);
    EXPECT_DOUBLE_EQ(split.value, 3.0);
    EXPECT_DOUBLE_EQ(split.score, 0.0);
}

TEST(SplitFinderTest, UnorderedPerfectSplit) {
    Matrix X(4, 1);
    X << 7, 2, 7, 2;
    Dataset ds(X, {1, 0, 1, 0}, {FeatureKind::Unordered});

    SplitFinder finder(Criterion::Entropy);
    auto split = finder.find_feature_split(ds, all_rows(ds), 0, 0.5);

    ASSERT_TRUE(split.is_valid);
    EXPECT_EQ(split.kind, FeatureKind::Unordered);
    EXPECT_DOUBLE_EQ(split.value, 2.0);
    EXPECT_DOUBLE_EQ(split.score, 0.0);
    EXPECT_TRUE(split.goes_left(2.0));
    EXPECT_FALSE(split.goes_left(1.0));
}

TEST(SplitFinderTest, ConstantFeatureHasNoSplit) {
    Matrix X(4, 1);
    X << 1, 1, 1, 1;
    Dataset ds(X, {0, 1, 0, 1});

    SplitFinder finder(Criterion::Gini);
    EXPECT_FALSE(finder.find_feature_split(ds, all_rows(ds), 0, 0.5).is_valid);
}

TEST(SplitFinderTest, TiesKeepFirstFeature) {
    Matrix X(4, 2);
    X << 1, 1,
         2, 2,
         3, 3,
         4, 4;
    Dataset ds(X, {0, 0, 1, 1});

    SplitFinder finder(Criterion::Gini);
    auto split = finder.find_best_split(ds, all_rows(ds), {1, 0}, 0.5);
    ASSERT_TRUE(split.is_valid);
    EXPECT_EQ(split.feature, 1u);

    split = finder.find_best_split(ds, all_rows(ds), {0, 1}, 0.5);
    EXPECT_EQ(split.feature, 0u);
}

TEST(SplitFinderTest, Partition) {
    Matrix X(4, 1);
    X << 5, 1, 4, 2;
    Dataset ds(X, {0, 0, 1, 1});

    SplitInfo split;
    split.feature = 0;
    split.value = 2.0;

    std::vector<Index> left, right;
    SplitFinder::partition(ds, all_rows(ds), split, left, right);
    EXPECT_EQ(left, (std::vector<Index>{1, 3}));
    EXPECT_EQ(right, (std::vector<Index>{0, 2}));
}

TEST(SplitFinderTest, RejectsZeroCandidates) {
    EXPECT_THROW(SplitFinder(Criterion::Gini, 0), std::invalid_argument);
}
