#include "aidcluster/pipeline.hpp"
#include "aidcluster/dbscan.hpp"
#include "aidcluster/hierarchical.hpp"
#include "aidcluster/log.hpp"

#include <utility>

namespace aidcluster {

namespace {

constexpr const char* kSearchAlgorithm = "kmeans.search";

// k = 0 marks an automatic choice over [k_min, k_max].
ClusterParams search_params(int k_min, int k_max) {
    ClusterParams p;
    p.k = 0;
    p.k_min = k_min;
    p.k_max = k_max;
    return p;
}

}  // namespace

AnalysisPipeline::AnalysisPipeline(EngineConfig cfg, ModelCache* cache)
    : cfg_(std::move(cfg)), cache_(cache) {
    cfg_.validate();
}

ClusterAssignment AnalysisPipeline::fit_cached(IClusterer& clusterer,
                                               const FeatureMatrix& matrix,
                                               const ClusterParams& params) const {
    if (!cache_) return clusterer.fit(matrix, params);

    CacheKey key = make_key(matrix, clusterer.name(), params, cfg_.train_config());
    if (auto hit = cache_->get(key)) {
        AC_LOG_DEBUG("pipeline", "cache hit for %s", clusterer.name().c_str());
        return *hit;
    }
    ClusterAssignment fitted = clusterer.fit(matrix, params);
    cache_->put(key, fitted);
    return fitted;
}

KSearchResult AnalysisPipeline::search_cached(const CentroidClusterer& centroid,
                                              const FeatureMatrix& matrix,
                                              int k_max) const {
    if (!cache_) return centroid.search_k(matrix, cfg_.k_min, k_max);

    CacheKey key = make_key(matrix, kSearchAlgorithm, search_params(cfg_.k_min, k_max),
                            cfg_.train_config());
    if (auto hit = cache_->get_search(key)) {
        AC_LOG_DEBUG("pipeline", "cache hit for k search [%d, %d]", cfg_.k_min, k_max);
        return *hit;
    }
    KSearchResult search = centroid.search_k(matrix, cfg_.k_min, k_max);
    cache_->put_search(key, search);
    return search;
}

ClusterAssignment AnalysisPipeline::fit_best_cached(CentroidClusterer& centroid,
                                                    const FeatureMatrix& matrix,
                                                    KSearchResult* search) const {
    if (!cache_) return centroid.fit_best(matrix, cfg_.k_min, cfg_.k_max, search);

    const ClusterParams params = search_params(cfg_.k_min, cfg_.k_max);
    const TrainConfig train = cfg_.train_config();
    CacheKey fit_key = make_key(matrix, centroid.name(), params, train);
    CacheKey search_key = make_key(matrix, kSearchAlgorithm, params, train);

    auto fitted = cache_->get(fit_key);
    auto scored = fitted ? cache_->get_search(search_key) : nullptr;
    if (fitted && scored) {
        AC_LOG_DEBUG("pipeline", "cache hit for %s with k search", centroid.name().c_str());
        *search = *scored;
        return *fitted;
    }

    ClusterAssignment out = centroid.fit_best(matrix, cfg_.k_min, cfg_.k_max, search);
    cache_->put(fit_key, out);
    cache_->put_search(search_key, *search);
    return out;
}

AnalysisReport AnalysisPipeline::run(const FeatureMatrix& matrix) const {
    AnalysisReport report;

    CentroidClusterer centroid(cfg_.train_config());
    if (cfg_.k) {
        report.chosen_k = *cfg_.k;
        const int search_max = matrix.rows() < static_cast<size_t>(cfg_.k_max)
                                   ? static_cast<int>(matrix.rows())
                                   : cfg_.k_max;
        if (cfg_.k_min <= search_max) {
            report.search = search_cached(centroid, matrix, search_max);
        } else {
            AC_LOG_INFO("pipeline", "k search skipped: %zu records, k_min=%d",
                        matrix.rows(), cfg_.k_min);
        }
        report.centroid = fit_cached(centroid, matrix, cfg_.cluster_params(report.chosen_k));
    } else {
        report.centroid = fit_best_cached(centroid, matrix, &report.search);
        report.chosen_k = *report.search.best_k;
    }

    const ClusterParams params = cfg_.cluster_params(report.chosen_k);

    HierarchicalClusterer hierarchical;
    DensityClusterer density;
    report.hierarchical = fit_cached(hierarchical, matrix, params);
    report.density = fit_cached(density, matrix, params);

    report.projection = ClusterEvaluator::project(matrix, cfg_.projection_dims);

    report.centroid_profiles = ClusterEvaluator::profile(report.centroid, matrix);
    report.hierarchical_profiles = ClusterEvaluator::profile(report.hierarchical, matrix);
    report.density_profiles = ClusterEvaluator::profile(report.density, matrix);

    report.centroid_silhouette = ClusterEvaluator::silhouette(report.centroid, matrix);
    report.hierarchical_silhouette = ClusterEvaluator::silhouette(report.hierarchical, matrix);
    report.density_silhouette = ClusterEvaluator::silhouette(report.density, matrix);

    report.consistency = ClusterEvaluator::check_consistency(
        report.centroid, report.hierarchical, cfg_.agreement_threshold);

    PriorityRanker ranker(cfg_.rank_config());
    report.priorities = ranker.rank(report.centroid, matrix, report.centroid_profiles);
    report.cluster_priorities =
        ranker.rank_clusters(report.centroid_profiles, matrix.feature_names());
    report.hierarchical_cluster_priorities =
        ranker.rank_clusters(report.hierarchical_profiles, matrix.feature_names());
    report.aid_priority = PriorityRanker::aid_priority_set(
        report.centroid, report.cluster_priorities,
        report.hierarchical, report.hierarchical_cluster_priorities);

    AC_LOG_INFO("pipeline", "n=%zu k=%d ward_cut=%d dbscan_clusters=%d noise=%zu ari=%.4f",
                matrix.rows(), report.chosen_k, params.linkage_cut_k,
                report.density.n_clusters, report.density.noise_count(),
                report.consistency.score);
    return report;
}

}  // namespace aidcluster
