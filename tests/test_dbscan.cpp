#include <gtest/gtest.h>
#include "aidcluster/dbscan.hpp"
#include "aidcluster/metrics.hpp"
#include "test_helpers.hpp"

#include <cmath>

using namespace aidcluster;
using namespace aidcluster::testing_util;

TEST(DensityClustering, OutlierIsNoise) {
    FeatureMatrix m = FeatureMatrix::from_rows(
        {"t0", "t1", "t2", "far"}, {"x", "y"},
        {{0.0, 0.0}, {0.0, 0.5}, {0.5, 0.0}, {50.0, 50.0}});
    DensityClusterer db;
    ClusterAssignment a = db.fit(m, 1.0, 3);

    EXPECT_EQ(a.label_of("far"), kNoiseLabel);
    EXPECT_GE(a.labels[0], 0);
    EXPECT_EQ(a.labels[0], a.labels[1]);
    EXPECT_EQ(a.labels[1], a.labels[2]);
    EXPECT_EQ(a.n_clusters, 1);
    EXPECT_EQ(a.noise_count(), 1u);
    EXPECT_EQ(a.algorithm, "dbscan");
}

TEST(DensityClustering, UnreachableSparsePointsAreNoise) {
    for (unsigned seed = 1; seed <= 6; ++seed) {
        FeatureMatrix m = make_uniform(80, 2, seed);
        const double eps = 0.9;
        const int min_samples = 4;
        DensityClusterer db;
        ClusterAssignment a = db.fit(m, eps, min_samples);

        const size_t n = m.rows();
        std::vector<int> counts(n, 0);
        for (size_t i = 0; i < n; ++i)
            for (size_t j = 0; j < n; ++j)
                if (squared_l2(m.row(i), m.row(j), 2) <= eps * eps) counts[i]++;

        for (size_t i = 0; i < n; ++i) {
            bool core = counts[i] >= min_samples;
            bool near_core = false;
            for (size_t j = 0; j < n; ++j)
                if (counts[j] >= min_samples && squared_l2(m.row(i), m.row(j), 2) <= eps * eps)
                    near_core = true;
            if (!core && !near_core)
                EXPECT_EQ(a.labels[i], kNoiseLabel) << "seed=" << seed << " i=" << i;
            if (core)
                EXPECT_GE(a.labels[i], 0) << "seed=" << seed << " i=" << i;
        }
    }
}

TEST(DensityClustering, ClustersNumberedInDiscoveryOrder) {
    FeatureMatrix m = FeatureMatrix::from_rows(
        {"b0", "a0", "b1", "a1", "b2", "a2"}, {"x"},
        {{100.0}, {0.0}, {100.2}, {0.2}, {100.4}, {0.4}});
    DensityClusterer db;
    ClusterAssignment a = db.fit(m, 0.5, 2);
    EXPECT_EQ(a.labels, (std::vector<int>{0, 1, 0, 1, 0, 1}));
}

TEST(DensityClustering, BorderPointJoinsCluster) {
    // 0.0, 0.1, 0.2 are core (min_samples 3); 0.65 only reaches 0.2.
    FeatureMatrix m = FeatureMatrix::from_rows(
        {"c0", "c1", "c2", "edge"}, {"x"}, {{0.0}, {0.1}, {0.2}, {0.65}});
    DensityClusterer db;
    ClusterAssignment a = db.fit(m, 0.5, 3);
    EXPECT_EQ(a.labels, (std::vector<int>{0, 0, 0, 0}));
    EXPECT_EQ(db.model().n_core(), 3u);
}

TEST(DensityClustering, PredictUsesCorePoints) {
    FeatureMatrix m = FeatureMatrix::from_rows(
        {"t0", "t1", "t2", "far"}, {"x", "y"},
        {{0.0, 0.0}, {0.0, 0.5}, {0.5, 0.0}, {50.0, 50.0}});
    DensityClusterer db;
    db.fit(m, 1.0, 3);

    FeatureMatrix q = FeatureMatrix::from_rows({"near", "away"}, {"x", "y"},
                                               {{0.2, 0.2}, {20.0, 20.0}});
    EXPECT_EQ(db.predict(q), (std::vector<int>{0, kNoiseLabel}));
}

TEST(DensityClustering, RejectsBadParameters) {
    FeatureMatrix m = make_two_triples();
    DensityClusterer db;
    EXPECT_THROW(db.fit(m, 0.0, 3), ConfigurationError);
    EXPECT_THROW(db.fit(m, -1.0, 3), ConfigurationError);
    EXPECT_THROW(db.fit(m, 1.0, 0), ConfigurationError);
    EXPECT_THROW(db.predict(m), ConfigurationError);

    ClusterParams p;
    p.min_samples = -2;
    try {
        db.fit(m, p);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.parameter(), "min_samples");
    }
}
