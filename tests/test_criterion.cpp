/**
 * Canopy Impurity Criterion Tests
 */

#include <gtest/gtest.h>
#include "canopy/criterion.hpp"
#include "canopy/config.hpp"
#include <cmath>

using namespace canopy;

TEST(ClassCountsTest, FirstObservedOrder) {
    auto counts = ClassCounts::of(LabelVector{2, 0, 2, 1});

    EXPECT_EQ(counts.total(), 4u);
    EXPECT_EQ(counts.n_classes(), 3u);
    EXPECT_EQ(counts.labels(), (std::vector<Label>{2, 0, 1}));
    EXPECT_EQ(counts.counts(), (std::vector<Index>{2, 1, 1}));
}

TEST(ClassCountsTest, MajorityTieGoesToSmallestLabel) {
    EXPECT_EQ(ClassCounts::of(LabelVector{5, 3, 5, 3}).majority(), 3);
    EXPECT_EQ(ClassCounts::of(LabelVector{1, 1, 0}).majority(), 1);
}

TEST(ClassCountsTest, RowSubset) {
    LabelVector labels = {0, 1, 1, 0};
    auto counts = ClassCounts::of(labels, {1, 2, 2});

    EXPECT_EQ(counts.total(), 3u);
    EXPECT_EQ(counts.n_classes(), 1u);
    EXPECT_EQ(counts.majority(), 1);
}

TEST(ImpurityTest, PureLabelsScoreZero) {
    const LabelVector pure = {4, 4, 4, 4, 4};
    for (Criterion c : {Criterion::Gini, Criterion::Entropy, Criterion::Error, Criterion::Sqrt}) {
        EXPECT_DOUBLE_EQ(ImpurityCriterion(c)(pure), 0.0) << criterion_name(c);
    }
}

TEST(ImpurityTest, EmptyLabelsScoreZero) {
    const LabelVector empty;
    for (Criterion c : {Criterion::Gini, Criterion::Entropy, Criterion::Error, Criterion::Sqrt}) {
        EXPECT_DOUBLE_EQ(ImpurityCriterion(c)(empty), 0.0) << criterion_name(c);
    }
}

TEST(ImpurityTest, GiniBinary) {
    ImpurityCriterion gini(Criterion::Gini);

    // p = 0.25: 2 * 0.25 * 0.75
    EXPECT_DOUBLE_EQ(gini(LabelVector{0, 1, 1, 1}), 0.375);
    EXPECT_DOUBLE_EQ(gini(LabelVector{0, 1}), 0.5);
}

TEST(ImpurityTest, GiniMultiClass) {
    ImpurityCriterion gini(Criterion::Gini);
    EXPECT_NEAR(gini(LabelVector{0, 1, 2}), 1.0 - 3.0 / 9.0, 1e-12);
}

TEST(ImpurityTest, EntropyIsHalved) {
    ImpurityCriterion entropy(Criterion::Entropy);

    EXPECT_DOUBLE_EQ(entropy(LabelVector{0, 1}), 0.5);
    EXPECT_NEAR(entropy(LabelVector{0, 1, 2, 3}), 1.0, 1e-12);
}

TEST(ImpurityTest, Error) {
    ImpurityCriterion error(Criterion::Error);
    EXPECT_DOUBLE_EQ(error(LabelVector{0, 0, 0, 1}), 0.25);
}

TEST(ImpurityTest, SqrtUsesFirstObservedClass) {
    ImpurityCriterion sq(Criterion::Sqrt);

    EXPECT_DOUBLE_EQ(sq(LabelVector{0, 1, 1, 1}), std::sqrt(0.25 * 0.75));
    EXPECT_DOUBLE_EQ(sq(LabelVector{1, 0, 0, 0}), std::sqrt(0.25 * 0.75));
    EXPECT_EQ(sq.type(), Criterion::Sqrt);
}
