#ifndef AIDCLUSTER_PIPELINE_HPP
#define AIDCLUSTER_PIPELINE_HPP

#include "engine_config.hpp"
#include "evaluator.hpp"
#include "kmeans.hpp"
#include "model_cache.hpp"
#include "ranker.hpp"
#include "types.hpp"

#include <map>
#include <vector>

namespace aidcluster {

struct AnalysisReport {
    KSearchResult search;
    int chosen_k = 0;

    ClusterAssignment centroid;
    ClusterAssignment hierarchical;
    ClusterAssignment density;

    std::map<int, ClusterProfile> centroid_profiles;
    std::map<int, ClusterProfile> hierarchical_profiles;
    std::map<int, ClusterProfile> density_profiles;

    double centroid_silhouette = 0.0;
    double hierarchical_silhouette = 0.0;
    double density_silhouette = 0.0;  // NaN unless >= 2 clusters among non-noise

    Projection projection;
    ConsistencyReport consistency;  // centroid vs hierarchical

    std::vector<PriorityEntry> priorities;            // over the centroid assignment
    std::vector<ClusterPriority> cluster_priorities;
    std::vector<ClusterPriority> hierarchical_cluster_priorities;
    AidPrioritySet aid_priority;  // top centroid cluster + top hierarchical cluster
};

/**
 * Runs search, the three clusterers, evaluation and ranking in order.
 * Without an explicit k the centroid assignment is the partition the
 * search scored for best_k. With one, the search is informational and
 * its upper bound is clamped to the record count.
 * The cache, when given, is borrowed and must outlive the pipeline.
 */
class AnalysisPipeline {
public:
    explicit AnalysisPipeline(EngineConfig cfg, ModelCache* cache = nullptr);

    AnalysisReport run(const FeatureMatrix& matrix) const;

    const EngineConfig& config() const { return cfg_; }

private:
    ClusterAssignment fit_cached(IClusterer& clusterer, const FeatureMatrix& matrix,
                                 const ClusterParams& params) const;

    KSearchResult search_cached(const CentroidClusterer& centroid, const FeatureMatrix& matrix,
                                int k_max) const;

    ClusterAssignment fit_best_cached(CentroidClusterer& centroid, const FeatureMatrix& matrix,
                                      KSearchResult* search) const;

    EngineConfig cfg_;
    ModelCache* cache_;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_PIPELINE_HPP
