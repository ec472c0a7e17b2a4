/**
 * Canopy Metrics Tests
 */

#include <gtest/gtest.h>
#include "canopy/metrics.hpp"

using namespace canopy;

TEST(MetricsTest, Accuracy) {
    EXPECT_DOUBLE_EQ(Metrics::accuracy({0, 1, 1, 0}, {0, 1, 0, 0}), 0.75);
    EXPECT_DOUBLE_EQ(Metrics::accuracy({2, 2}, {2, 2}), 1.0);
}

TEST(MetricsTest, InputErrors) {
    EXPECT_THROW(Metrics::accuracy({0, 1}, {0}), std::invalid_argument);
    EXPECT_THROW(Metrics::accuracy({}, {}), std::invalid_argument);
    EXPECT_THROW(Metrics::confusion_matrix({0}, {0, 1}), std::invalid_argument);
    EXPECT_THROW(Metrics::classification_report({}, {}), std::invalid_argument);
}

TEST(ConfusionMatrixTest, LabelsFromBothSides) {
    // Label 3 only appears in the predictions
    auto cm = Metrics::confusion_matrix({0, 1, 1, 0, 1}, {0, 1, 3, 1, 1});

    EXPECT_EQ(cm.labels, (LabelVector{0, 1, 3}));
    EXPECT_EQ(cm.at(0, 0), 1u);
    EXPECT_EQ(cm.at(0, 1), 1u);
    EXPECT_EQ(cm.at(1, 1), 2u);
    EXPECT_EQ(cm.at(1, 3), 1u);
    EXPECT_EQ(cm.at(3, 3), 0u);
    EXPECT_THROW(cm.at(2, 0), std::invalid_argument);
}

TEST(ClassificationReportTest, PerClassAndWeighted) {
    LabelVector y_true = {0, 0, 0, 0, 1, 1};
    LabelVector y_pred = {0, 0, 0, 1, 1, 0};

    auto report = Metrics::classification_report(y_true, y_pred);
    ASSERT_EQ(report.classes.size(), 2u);

    const auto& c0 = report.classes[0];
    EXPECT_EQ(c0.label, 0);
    EXPECT_DOUBLE_EQ(c0.precision, 0.75);
    EXPECT_DOUBLE_EQ(c0.recall, 0.75);
    EXPECT_DOUBLE_EQ(c0.f1, 0.75);
    EXPECT_EQ(c0.support, 4u);

    const auto& c1 = report.classes[1];
    EXPECT_DOUBLE_EQ(c1.precision, 0.5);
    EXPECT_DOUBLE_EQ(c1.recall, 0.5);
    EXPECT_EQ(c1.support, 2u);

    EXPECT_NEAR(report.weighted_avg.precision, (4 * 0.75 + 2 * 0.5) / 6.0, 1e-12);
    EXPECT_EQ(report.weighted_avg.support, 6u);
    EXPECT_NEAR(report.accuracy, 4.0 / 6.0, 1e-12);
    EXPECT_FALSE(report.to_string().empty());
}

TEST(ClassificationReportTest, ZeroDenominatorsGiveZero) {
    // Label 1 is never predicted, label 2 never occurs
    auto report = Metrics::classification_report({0, 1}, {0, 2});
    ASSERT_EQ(report.classes.size(), 3u);

    EXPECT_DOUBLE_EQ(report.classes[1].precision, 0.0);
    EXPECT_DOUBLE_EQ(report.classes[1].recall, 0.0);
    EXPECT_DOUBLE_EQ(report.classes[1].f1, 0.0);
    EXPECT_DOUBLE_EQ(report.classes[2].recall, 0.0);
    EXPECT_EQ(report.classes[2].support, 0u);
}
