#include <gtest/gtest.h>
#include "aidcluster/clusterer_factory.hpp"
#include "aidcluster/pipeline.hpp"
#include "aidcluster/table_writer.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <string>
#include <vector>

using namespace aidcluster;
using namespace aidcluster::testing_util;

namespace {

const std::vector<std::string> kIndicators = {"child_mort", "total_fer", "income",
                                              "life_expec", "gdpp"};

FeatureMatrix four_groups() {
    return make_blobs({{8, 8, -8, -8, -8},
                       {-8, -8, 8, 8, 8},
                       {8, -8, 8, -8, 0},
                       {-8, 8, -8, 8, 0}},
                      12, 0.5, 101, kIndicators);
}

EngineConfig small_config() {
    EngineConfig cfg;
    cfg.k_max = 6;
    cfg.eps = 3.0;
    cfg.n_init = 3;
    return cfg;
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

}  // namespace

TEST(ClustererFactory, CreatesByNameCaseInsensitive) {
    EXPECT_EQ(ClustererFactory::create("kmeans")->name(), "kmeans");
    EXPECT_EQ(ClustererFactory::create("Centroid")->name(), "kmeans");
    EXPECT_EQ(ClustererFactory::create("WARD")->name(), "hierarchical");
    EXPECT_EQ(ClustererFactory::create("hierarchical")->name(), "hierarchical");
    EXPECT_EQ(ClustererFactory::create("DBSCAN")->name(), "dbscan");
    EXPECT_EQ(ClustererFactory::create("density")->name(), "dbscan");
    EXPECT_TRUE(ClustererFactory::is_valid_algorithm("Ward"));
    EXPECT_FALSE(ClustererFactory::is_valid_algorithm("spectral"));
    EXPECT_EQ(ClustererFactory::available_algorithms().size(), 3u);

    try {
        ClustererFactory::create("spectral");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.parameter(), "algorithm");
    }
}

TEST(ClustererFactory, VariantsShareTheInterface) {
    FeatureMatrix m = make_two_triples();
    ClusterParams p;
    p.k = 2;
    p.linkage_cut_k = 2;
    p.eps = 2.0;
    p.min_samples = 2;
    for (const auto& name : ClustererFactory::available_algorithms()) {
        auto clusterer = ClustererFactory::create(name);
        ClusterAssignment a = clusterer->fit(m, p);
        EXPECT_EQ(a.n_clusters, 2) << name;
        EXPECT_NE(a.labels[0], a.labels[3]) << name;
    }
}

TEST(EngineConfigTest, DefaultsAndValidation) {
    EngineConfig cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_EQ(cfg.k_min, 2);
    EXPECT_EQ(cfg.k_max, 10);
    EXPECT_DOUBLE_EQ(cfg.eps, 1.5);
    EXPECT_EQ(cfg.min_samples, 3);
    EXPECT_EQ(cfg.random_seed, 42u);
    EXPECT_EQ(cfg.vulnerability_weights.size(), 5u);
    EXPECT_EQ(cfg.cluster_params(4).linkage_cut_k, 4);

    cfg.linkage_cut_k = 3;
    EXPECT_EQ(cfg.cluster_params(4).linkage_cut_k, 3);

    EngineConfig bad;
    bad.tier_low = 1.0;
    bad.tier_high = -1.0;
    try {
        bad.validate();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.parameter(), "tier_thresholds");
    }

    EngineConfig eps;
    eps.eps = 0.0;
    EXPECT_THROW(AnalysisPipeline{eps}, ConfigurationError);
}

TEST(AnalysisPipelineTest, EndToEnd) {
    FeatureMatrix m = four_groups();
    AnalysisPipeline pipeline(small_config());
    AnalysisReport r = pipeline.run(m);

    EXPECT_EQ(r.chosen_k, 4);
    EXPECT_EQ(r.search.scores.size(), 5u);
    EXPECT_EQ(r.centroid.n_clusters, 4);
    EXPECT_EQ(r.hierarchical.n_clusters, 4);
    EXPECT_EQ(r.density.n_clusters, 4);
    EXPECT_TRUE(r.consistency.consistent);
    EXPECT_DOUBLE_EQ(r.consistency.score, 1.0);
    EXPECT_GT(r.centroid_silhouette, 0.8);

    EXPECT_EQ(r.projection.dims, 2u);
    EXPECT_EQ(r.projection.coordinates.size(), m.rows() * 2);

    ASSERT_EQ(r.priorities.size(), m.rows());
    EXPECT_EQ(r.priorities.front().tier, Tier::High);
    EXPECT_EQ(r.priorities.back().tier, Tier::Low);
    ASSERT_EQ(r.cluster_priorities.size(), 4u);
    // Group 0 centre scores highest.
    EXPECT_EQ(r.cluster_priorities[0].cluster_id, r.centroid.labels[0]);

    // The centroid assignment is the partition the search scored.
    const KScore& scored = r.search.scores[static_cast<size_t>(r.chosen_k - 2)];
    EXPECT_DOUBLE_EQ(r.centroid_silhouette, scored.silhouette);
}

TEST(AnalysisPipelineTest, AidSetAndClusterMembers) {
    FeatureMatrix m = four_groups();
    AnalysisReport r = AnalysisPipeline(small_config()).run(m);

    ASSERT_EQ(r.hierarchical_cluster_priorities.size(), 4u);
    EXPECT_EQ(r.hierarchical_cluster_priorities[0].cluster_id, r.hierarchical.labels[0]);

    EXPECT_EQ(r.aid_priority.centroid_cluster, r.centroid.labels[0]);
    EXPECT_EQ(r.aid_priority.hierarchical_cluster, r.hierarchical.labels[0]);
    // Both methods put group 0 (records r0..r11) on top.
    ASSERT_EQ(r.aid_priority.ids.size(), 12u);
    for (const auto& id : r.aid_priority.ids)
        EXPECT_EQ(r.centroid.label_of(id), r.centroid.labels[0]) << id;
    EXPECT_TRUE(std::is_sorted(r.aid_priority.ids.begin(), r.aid_priority.ids.end()));

    const ClusterProfile& top = r.centroid_profiles.at(r.centroid.labels[0]);
    ASSERT_EQ(top.members.size(), top.count);
    EXPECT_EQ(top.members.front(), "r0");
    EXPECT_EQ(top.members.back(), "r11");
    size_t listed = 0;
    for (const auto& kv : r.hierarchical_profiles) listed += kv.second.members.size();
    EXPECT_EQ(listed, m.rows());

    std::string json = profiles_to_json(r.centroid_profiles, m.feature_names(), false);
    EXPECT_NE(json.find("\"members\": [\"r0\", \"r1\", "), std::string::npos);
}

TEST(AnalysisPipelineTest, SuppliedKWithFewerRecordsThanKMax) {
    FeatureMatrix m = make_two_triples();
    EngineConfig cfg;
    cfg.k = 2;
    cfg.vulnerability_weights = {{"x", 1.0}, {"y", 0.5}};
    ASSERT_GT(static_cast<size_t>(cfg.k_max), m.rows());

    AnalysisReport r = AnalysisPipeline(cfg).run(m);
    EXPECT_EQ(r.chosen_k, 2);
    EXPECT_EQ(r.centroid.n_clusters, 2);
    EXPECT_EQ(r.hierarchical.n_clusters, 2);
    // Search clamped to [k_min, record count].
    ASSERT_EQ(r.search.scores.size(), 5u);
    EXPECT_EQ(r.search.scores.back().k, 6);

    cfg.k_min = 8;
    AnalysisReport skipped = AnalysisPipeline(cfg).run(m);
    EXPECT_TRUE(skipped.search.scores.empty());
    EXPECT_EQ(skipped.centroid.n_clusters, 2);

    // Without a supplied k the range is still enforced.
    EngineConfig automatic;
    automatic.vulnerability_weights = cfg.vulnerability_weights;
    try {
        AnalysisPipeline(automatic).run(m);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.parameter(), "k_max");
    }
}

TEST(AnalysisPipelineTest, CacheServesSearchAndScoredPartition) {
    FeatureMatrix m = four_groups();
    ModelCache cache;
    AnalysisPipeline pipeline(small_config(), &cache);

    AnalysisReport first = pipeline.run(m);
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.search_count(), 1u);
    EXPECT_EQ(cache.hits(), 0u);

    AnalysisReport second = pipeline.run(m);
    EXPECT_EQ(cache.hits(), 4u);
    EXPECT_EQ(second.chosen_k, first.chosen_k);
    ASSERT_EQ(second.search.scores.size(), first.search.scores.size());
    for (size_t i = 0; i < first.search.scores.size(); ++i)
        EXPECT_DOUBLE_EQ(second.search.scores[i].inertia, first.search.scores[i].inertia);
    EXPECT_EQ(second.centroid.labels, first.centroid.labels);

    EXPECT_EQ(cache.invalidate_matrix(fingerprint(m)), 4u);
    EXPECT_EQ(cache.search_count(), 0u);
}

TEST(AnalysisPipelineTest, OverrideKAndCache) {
    FeatureMatrix m = four_groups();
    EngineConfig cfg = small_config();
    cfg.k = 2;
    cfg.linkage_cut_k = 4;
    ModelCache cache;
    AnalysisPipeline pipeline(cfg, &cache);

    AnalysisReport first = pipeline.run(m);
    EXPECT_EQ(first.chosen_k, 2);
    EXPECT_EQ(first.centroid.n_clusters, 2);
    EXPECT_EQ(first.hierarchical.n_clusters, 4);
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.search_count(), 1u);
    EXPECT_EQ(cache.hits(), 0u);

    AnalysisReport second = pipeline.run(m);
    EXPECT_EQ(cache.hits(), 4u);
    EXPECT_EQ(second.search.scores.size(), first.search.scores.size());
    EXPECT_EQ(second.centroid.labels, first.centroid.labels);
    EXPECT_EQ(second.density.labels, first.density.labels);
}

TEST(TableWriter, CsvExports) {
    FeatureMatrix m = four_groups();
    AnalysisReport r = AnalysisPipeline(small_config()).run(m);
    const std::string dir = ::testing::TempDir();

    write_assignment_csv(dir + "assign.csv", r.centroid);
    auto lines = read_lines(dir + "assign.csv");
    ASSERT_EQ(lines.size(), m.rows() + 1);
    EXPECT_EQ(lines[0], "id,algorithm,cluster_id");
    EXPECT_EQ(lines[1], "r0,kmeans,0");

    write_profiles_csv(dir + "profiles.csv", r.centroid_profiles, m.feature_names());
    lines = read_lines(dir + "profiles.csv");
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0].rfind("cluster_id,count,mean_child_mort,", 0), 0u);

    write_priorities_csv(dir + "priorities.csv", r.priorities);
    lines = read_lines(dir + "priorities.csv");
    ASSERT_EQ(lines.size(), m.rows() + 1);
    EXPECT_EQ(lines[0], "rank,id,cluster_id,score,cluster_score,tier");
    EXPECT_EQ(lines[1].rfind("1,", 0), 0u);
    EXPECT_NE(lines[1].find(",HIGH"), std::string::npos);

    EXPECT_THROW(write_assignment_csv(dir + "missing/dir/x.csv", r.centroid), std::runtime_error);
}

TEST(TableWriter, JsonExportsEscapeAndNullNaN) {
    std::vector<PriorityEntry> entries(1);
    entries[0].id = "Cote \"d\" Ivoire";
    entries[0].cluster_id = kNoiseLabel;
    entries[0].score = 1.25;
    entries[0].cluster_score = std::nan("");
    entries[0].tier = Tier::Review;
    entries[0].rank = 1;

    std::string json = priorities_to_json(entries, {}, false);
    EXPECT_NE(json.find("\"id\": \"Cote \\\"d\\\" Ivoire\""), std::string::npos);
    EXPECT_NE(json.find("\"cluster_score\": null"), std::string::npos);
    EXPECT_NE(json.find("\"tier\": \"REVIEW\""), std::string::npos);

    std::map<int, ClusterProfile> profiles;
    profiles[0] = ClusterProfile{0, 2, {1.5}, {0.5}};
    std::string pj = profiles_to_json(profiles, {"x"});
    EXPECT_NE(pj.find("\"features\": [\"x\"]"), std::string::npos);
    EXPECT_NE(pj.find("\"mean\": [1.5]"), std::string::npos);
    EXPECT_NE(pj.find("\"count\": 2"), std::string::npos);
}
