#include <gtest/gtest.h>
#include "aidcluster/preprocessing.hpp"

#include <cmath>

using namespace aidcluster;

namespace {

RawTable sample_table() {
    RawTable t;
    t.columns = {"child_mort", "income", "const"};
    t.records = {
        {"A", {10.0, 1000.0, 7.0}},
        {"B", {20.0, 2000.0, 7.0}},
        {"C", {30.0, 3000.0, 7.0}},
        {"D", {40.0, 4000.0, 7.0}},
    };
    return t;
}

}  // namespace

TEST(Preprocessing, StandardizeUsesPopulationStd) {
    Scaler scaler;
    FeatureMatrix m = standardize(sample_table(), {}, &scaler);

    ASSERT_EQ(m.dim(), 3u);
    EXPECT_EQ(m.ids(), (std::vector<std::string>{"A", "B", "C", "D"}));
    EXPECT_DOUBLE_EQ(scaler.mean[0], 25.0);
    EXPECT_DOUBLE_EQ(scaler.scale[0], std::sqrt(125.0));
    EXPECT_DOUBLE_EQ(scaler.scale[2], 1.0);  // constant column

    for (size_t j = 0; j < 2; ++j) {
        double sum = 0.0, sq = 0.0;
        for (size_t i = 0; i < m.rows(); ++i) {
            sum += m.at(i, j);
            sq += m.at(i, j) * m.at(i, j);
        }
        EXPECT_NEAR(sum, 0.0, 1e-12);
        EXPECT_NEAR(sq / static_cast<double>(m.rows()), 1.0, 1e-12);
    }
    for (size_t i = 0; i < m.rows(); ++i) EXPECT_EQ(m.at(i, 2), 0.0);
}

TEST(Preprocessing, StandardizeSelectedColumnsAndScalerReuse) {
    Scaler scaler;
    FeatureMatrix m = standardize(sample_table(), {"income"}, &scaler);
    EXPECT_EQ(m.feature_names(), std::vector<std::string>{"income"});

    RawTable later;
    later.columns = {"income"};
    later.records = {{"E", {2500.0}}};
    FeatureMatrix z = scaler.transform(later);
    EXPECT_NEAR(z.at(0, 0), 0.0, 1e-12);

    EXPECT_THROW(standardize(sample_table(), {"gdpp"}), ConfigurationError);
}

TEST(Preprocessing, QuantileInterpolatesLinearly) {
    EXPECT_DOUBLE_EQ(quantile({1, 2, 3, 4, 100}, 0.25), 2.0);
    EXPECT_DOUBLE_EQ(quantile({4, 1, 3, 2}, 0.5), 2.5);
    EXPECT_DOUBLE_EQ(quantile({4, 1, 3, 2}, 0.25), 1.75);
    EXPECT_THROW(quantile({}, 0.5), DataShapeError);
}

TEST(Preprocessing, WinsorizeClipsOutliers) {
    RawTable t;
    t.columns = {"v", "w"};
    t.records = {{"a", {1, 1}}, {"b", {2, 1}}, {"c", {3, 1}}, {"d", {4, 1}}, {"e", {100, 1}}};
    RawTable out = winsorize_iqr(t, {"v"});
    // Q1 = 2, Q3 = 4, IQR = 2: bounds [-1, 7].
    EXPECT_DOUBLE_EQ(out.records[4].values[0], 7.0);
    EXPECT_DOUBLE_EQ(out.records[0].values[0], 1.0);
    EXPECT_DOUBLE_EQ(t.records[4].values[0], 100.0);
}

TEST(Preprocessing, RatioAndThresholdFeatures) {
    RawTable t = sample_table();
    RawTable ratio = add_ratio_feature(t, "income", "child_mort", "income_per_mort");
    ASSERT_EQ(ratio.columns.size(), 4u);
    EXPECT_DOUBLE_EQ(ratio.records[2].values[3], 100.0);

    RawTable flagged = add_threshold_flag(t, "child_mort", "high_mort");
    EXPECT_EQ(flagged.columns.back(), "high_mort");
    EXPECT_EQ(flagged.records[0].values.back(), 0.0);
    EXPECT_EQ(flagged.records[1].values.back(), 0.0);
    EXPECT_EQ(flagged.records[2].values.back(), 1.0);
    EXPECT_EQ(flagged.records[3].values.back(), 1.0);

    t.records[1].values[0] = 0.0;
    EXPECT_THROW(add_ratio_feature(t, "income", "child_mort", "r"), DataShapeError);
    EXPECT_THROW(add_threshold_flag(t, "income", "child_mort"), ConfigurationError);
}

TEST(Preprocessing, RejectsMalformedTables) {
    RawTable empty;
    empty.columns = {"x"};
    EXPECT_THROW(standardize(empty), DataShapeError);

    RawTable ragged = sample_table();
    ragged.records[2].values.pop_back();
    EXPECT_THROW(standardize(ragged), DataShapeError);

    RawTable dup = sample_table();
    dup.records[3].id = "A";
    EXPECT_THROW(standardize(dup), DataShapeError);

    RawTable nan = sample_table();
    nan.records[0].values[1] = std::nan("");
    EXPECT_THROW(standardize(nan), DataShapeError);
}
