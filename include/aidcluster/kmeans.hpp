#ifndef AIDCLUSTER_KMEANS_HPP
#define AIDCLUSTER_KMEANS_HPP

#include "iclusterer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace aidcluster {

struct TrainConfig {
    size_t max_iter = 300;
    int n_init = 10;      // seeded k-means++ restarts; lowest inertia wins
    unsigned seed = 42;
};

// Fitted centroid state. Centroids are stored after relabelling, so
// centroid c corresponds to cluster id c of the fit that produced them.
struct KMeansModel {
    int k = 0;
    size_t dim = 0;
    std::vector<double> centroids;  // k x dim, row-major
    double inertia = 0.0;
    int iterations = 0;
    bool converged = false;
    unsigned seed = 0;
};

struct KScore {
    int k;
    double inertia;     // within-cluster sum of squares, non-increasing in k
    double silhouette;  // NaN when undefined (k < 2, or k >= n)
    bool converged;
};

struct KSearchResult {
    std::vector<KScore> scores;   // ascending k
    std::optional<int> best_k;    // max silhouette over k >= 2, smallest k on ties
};

/**
 * Lloyd k-means with seeded k-means++ initialisation.
 * Assignment runs until no point changes cluster, bounded by max_iter.
 * Cluster ids are ordered by descending size (ties: lowest first member),
 * so repeated fits with the same seed and k return identical labels.
 */
class CentroidClusterer : public IClusterer {
public:
    explicit CentroidClusterer(const TrainConfig& cfg = {});

    // Fits every k in [k_min, k_max]; the per-k fits run as independent
    // OpenMP tasks and are collected in k order.
    KSearchResult search_k(const FeatureMatrix& matrix, int k_min, int k_max) const;

    // Fresh n_init restarts at a fixed k.
    ClusterAssignment fit(const FeatureMatrix& matrix, int k);

    // Runs search_k and returns the best_k partition exactly as it was
    // scored, warm-start repair included. The search is copied to *search
    // when non-null. Throws ConfigurationError("k_max") if no k qualifies.
    ClusterAssignment fit_best(const FeatureMatrix& matrix, int k_min, int k_max,
                               KSearchResult* search = nullptr);

    // params.k > 0 fits that k; otherwise fit_best(params.k_min, params.k_max).
    ClusterAssignment fit(const FeatureMatrix& matrix,
                          const ClusterParams& params) override;

    // Nearest-centroid labels for vectors of the fitted dimensionality.
    // Ties follow the same coordinate order as fitting, so predicting the
    // training matrix reproduces the fitted labels.
    std::vector<int> predict(const FeatureMatrix& matrix) const;

    bool is_fitted() const { return model_.k > 0; }
    const KMeansModel& model() const { return model_; }
    void load_model(KMeansModel model);

    const TrainConfig& config() const { return cfg_; }
    std::string name() const override { return "kmeans"; }

private:
    TrainConfig cfg_;
    KMeansModel model_;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_KMEANS_HPP
