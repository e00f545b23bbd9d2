#include <gtest/gtest.h>
#include "aidcluster/kmeans.hpp"
#include "aidcluster/model_cache.hpp"
#include "test_helpers.hpp"

#include <thread>
#include <vector>

using namespace aidcluster;
using namespace aidcluster::testing_util;

TEST(ModelCache, FingerprintTracksContent) {
    FeatureMatrix a = make_two_triples();
    FeatureMatrix same = make_two_triples();
    EXPECT_EQ(fingerprint(a), fingerprint(same));

    FeatureMatrix moved = FeatureMatrix::from_rows(
        a.ids(), a.feature_names(),
        {{0.0, 0.0}, {0.0, 1.0}, {1.0, 0.0}, {10.0, 10.0}, {10.0, 11.0}, {11.0, 10.5}});
    EXPECT_NE(fingerprint(a), fingerprint(moved));

    FeatureMatrix renamed = FeatureMatrix::from_rows(
        {"a0", "a1", "a2", "b0", "b1", "zz"}, a.feature_names(),
        {{0.0, 0.0}, {0.0, 1.0}, {1.0, 0.0}, {10.0, 10.0}, {10.0, 11.0}, {11.0, 10.0}});
    EXPECT_NE(fingerprint(a), fingerprint(renamed));
}

TEST(ModelCache, KeysSeparateAlgorithmsAndParameters) {
    FeatureMatrix m = make_two_triples();
    ClusterParams p;
    CacheKey base = make_key(m, "kmeans", p);
    EXPECT_EQ(base, make_key(m, "kmeans", p));
    EXPECT_FALSE(base == make_key(m, "dbscan", p));

    ClusterParams eps = p;
    eps.eps = 1.5000001;
    EXPECT_FALSE(base == make_key(m, "kmeans", eps));

    TrainConfig seed;
    seed.seed = 7;
    EXPECT_FALSE(base == make_key(m, "kmeans", p, seed));
}

TEST(ModelCache, HitMissAndInvalidation) {
    FeatureMatrix m = make_two_triples();
    FeatureMatrix other = make_uniform(6, 2, 3);
    CentroidClusterer km;
    ModelCache cache;

    ClusterParams p;
    p.k = 2;
    CacheKey key = make_key(m, km.name(), p);
    EXPECT_EQ(cache.get(key), nullptr);
    EXPECT_EQ(cache.misses(), 1u);

    cache.put(key, km.fit(m, p));
    auto hit = cache.get(key);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->n_clusters, 2);
    EXPECT_EQ(cache.hits(), 1u);

    CacheKey other_key = make_key(other, km.name(), p);
    cache.put(other_key, km.fit(other, p));
    p.k = 3;
    cache.put(make_key(m, km.name(), p), km.fit(m, p));
    EXPECT_EQ(cache.size(), 3u);

    EXPECT_EQ(cache.invalidate_matrix(fingerprint(m)), 2u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get(key), nullptr);
    // Entries handed out earlier stay valid.
    EXPECT_EQ(hit->labels.size(), 6u);

    EXPECT_TRUE(cache.invalidate(other_key));
    EXPECT_FALSE(cache.invalidate(other_key));
    cache.put(key, *hit);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(ModelCache, StoresSearchResultsBesideAssignments) {
    FeatureMatrix m = make_two_triples();
    CentroidClusterer km;
    ModelCache cache;

    ClusterParams p;
    p.k = 0;
    p.k_min = 2;
    p.k_max = 4;
    CacheKey key = make_key(m, "kmeans.search", p);
    EXPECT_EQ(cache.get_search(key), nullptr);

    cache.put_search(key, km.search_k(m, 2, 4));
    cache.put(key, km.fit(m, 2));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.search_count(), 1u);

    auto search = cache.get_search(key);
    ASSERT_NE(search, nullptr);
    EXPECT_EQ(search->scores.size(), 3u);
    EXPECT_EQ(*search->best_k, 2);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);

    EXPECT_TRUE(cache.invalidate(key));
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.search_count(), 0u);
}

TEST(ModelCache, ConcurrentReadersAndWriters) {
    FeatureMatrix m = make_two_triples();
    CentroidClusterer km;
    ClusterAssignment a = km.fit(m, 2);
    ModelCache cache;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 200; ++i) {
                ClusterParams p;
                p.k = 1 + (i + t) % 5;
                CacheKey key = make_key(m, "kmeans", p);
                if (!cache.get(key)) cache.put(key, a);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(cache.size(), 5u);
    EXPECT_EQ(cache.hits() + cache.misses(), 800u);
}
