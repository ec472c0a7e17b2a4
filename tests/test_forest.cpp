/**
 * Canopy Random Forest Tests
 */

#include <gtest/gtest.h>
#include "canopy/forest.hpp"
#include "canopy/metrics.hpp"
#include <numeric>
#include <random>

using namespace canopy;

namespace {

// Two noisy informative columns, one categorical column, one noise column
Dataset make_dataset(Index n, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<Float> noise(0.0, 0.3);
    std::uniform_int_distribution<int> category(0, 3);

    Matrix X(n, 4);
    LabelVector y(n);
    for (Index i = 0; i < n; ++i) {
        const Label label = static_cast<Label>(i % 2);
        X(i, 0) = label + noise(rng);
        X(i, 1) = -label + noise(rng);
        X(i, 2) = category(rng);
        X(i, 3) = noise(rng);
        y[i] = label;
    }
    return Dataset(X, y, {FeatureKind::Ordered, FeatureKind::Ordered,
                          FeatureKind::Unordered, FeatureKind::Ordered});
}

ForestConfig small_config(uint32_t n_estimators = 15) {
    ForestConfig config;
    config.n_estimators = n_estimators;
    config.seed = 2024;
    return config;
}

} // namespace

TEST(ForestTest, DefaultConstruction) {
    RandomForest forest;

    EXPECT_FALSE(forest.is_fitted());
    EXPECT_EQ(forest.n_trees(), 0u);
    EXPECT_EQ(forest.complexity().depth, 0.0);
}

TEST(ForestTest, PredictBeforeFitThrows) {
    RandomForest forest(small_config());
    Matrix X(1, 4);
    X.setZero();
    EXPECT_THROW(forest.predict(X), std::runtime_error);
}

TEST(ForestTest, FitsAllMembers) {
    Dataset ds = make_dataset(120, 1);
    RandomForest forest(small_config(12));
    forest.fit(ds);

    EXPECT_TRUE(forest.is_fitted());
    EXPECT_EQ(forest.n_trees(), 12u);
    EXPECT_EQ(forest.n_features(), 4u);
    EXPECT_EQ(forest.classes(), (LabelVector{0, 1}));

    // Members see bootstrap samples of full size
    for (size_t t = 0; t < forest.n_trees(); ++t) {
        EXPECT_EQ(forest.tree(t).root()->n_samples, 120u);
    }
}

TEST(ForestTest, LearnsSeparableData) {
    Dataset train = make_dataset(200, 3);
    Dataset test = make_dataset(100, 4);

    RandomForest forest(small_config(25));
    forest.fit(train);

    Float acc = Metrics::accuracy(test.labels(), forest.predict(test.features()));
    EXPECT_GT(acc, 0.9);
}

TEST(ForestTest, SameSeedSamePredictions) {
    Dataset train = make_dataset(150, 5);
    Dataset test = make_dataset(60, 6);

    RandomForest a(small_config());
    RandomForest b(small_config());
    a.fit(train);
    b.fit(train);

    EXPECT_EQ(a.predict(test.features()), b.predict(test.features()));
    EXPECT_EQ(a.feature_importances(), b.feature_importances());
}

TEST(ForestTest, ThreadCountDoesNotChangeResult) {
    Dataset train = make_dataset(150, 7);

    ForestConfig serial_config = small_config();
    serial_config.n_threads = 1;
    ForestConfig parallel_config = small_config();
    parallel_config.n_threads = 4;

    RandomForest serial(serial_config);
    RandomForest parallel(parallel_config);
    serial.fit(train);
    parallel.fit(train);

    EXPECT_EQ(serial.predict(train.features()), parallel.predict(train.features()));
}

TEST(ForestTest, VotesMatchMajority) {
    Dataset ds = make_dataset(100, 8);
    RandomForest forest(small_config(9));
    forest.fit(ds);

    auto votes = forest.predict_votes(ds.features());
    auto predicted = forest.predict(ds.features());
    ASSERT_EQ(votes.size(), predicted.size());

    for (size_t i = 0; i < votes.size(); ++i) {
        ASSERT_EQ(votes[i].size(), 2u);
        EXPECT_EQ(votes[i][0] + votes[i][1], 9u);
        Label majority = votes[i][1] > votes[i][0] ? 1 : 0;
        EXPECT_EQ(predicted[i], majority);
    }
}

TEST(ForestTest, ImportancesNormalized) {
    Dataset ds = make_dataset(120, 9);
    RandomForest forest(small_config());
    forest.fit(ds);

    auto imp = forest.feature_importances();
    ASSERT_EQ(imp.size(), 4u);
    EXPECT_NEAR(std::accumulate(imp.begin(), imp.end(), 0.0), 1.0, 1e-9);
}

TEST(ForestTest, ComplexityIsMemberMean) {
    Dataset ds = make_dataset(80, 10);
    RandomForest forest(small_config(5));
    forest.fit(ds);

    Float depth = 0.0;
    for (size_t t = 0; t < forest.n_trees(); ++t) {
        depth += forest.tree(t).depth();
    }
    EXPECT_DOUBLE_EQ(forest.complexity().depth, depth / 5.0);
}

TEST(ForestTest, SetParamReachesMembers) {
    Dataset ds = make_dataset(80, 11);
    RandomForest forest(small_config());
    forest.set_param("n_estimators", int64_t{4});
    forest.set_param("max_depth", int64_t{1});
    forest.fit(ds);

    EXPECT_EQ(forest.n_trees(), 4u);
    for (size_t t = 0; t < forest.n_trees(); ++t) {
        EXPECT_LE(forest.tree(t).depth(), 1u);
    }
    EXPECT_THROW(forest.set_param("bogus", int64_t{1}), std::invalid_argument);
}

TEST(ForestTest, RejectsEmptyDataset) {
    RandomForest forest(small_config());
    EXPECT_THROW(forest.fit(Dataset{}), std::invalid_argument);
}

TEST(ForestTest, FailedFitKeepsPreviousModel) {
    Dataset ds = make_dataset(80, 4);
    RandomForest forest(small_config(5));
    forest.fit(ds);
    LabelVector before = forest.predict(ds.features());

    EXPECT_THROW(forest.fit(Dataset{}), std::invalid_argument);
    EXPECT_TRUE(forest.is_fitted());
    EXPECT_EQ(forest.n_trees(), 5u);
    EXPECT_EQ(forest.predict(ds.features()), before);
}
