#ifndef AIDCLUSTER_ENGINE_CONFIG_HPP
#define AIDCLUSTER_ENGINE_CONFIG_HPP

#include "iclusterer.hpp"
#include "kmeans.hpp"
#include "ranker.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace aidcluster {

/**
 * Everything the analysis pipeline accepts. Defaults reproduce the
 * reference country analysis: k searched over [2, 10] with seed 42,
 * 10 restarts and a 300 iteration cap; DBSCAN with eps 1.5 and
 * min_samples 3; tiers at +/-0.5.
 */
struct EngineConfig {
    int k_min = 2;
    int k_max = 10;
    std::optional<int> k;              // overrides the silhouette choice
    std::optional<int> linkage_cut_k;  // defaults to the chosen k
    double eps = 1.5;
    int min_samples = 3;
    std::vector<FeatureWeight> vulnerability_weights = default_vulnerability_weights();
    double tier_low = -0.5;
    double tier_high = 0.5;
    unsigned random_seed = 42;
    size_t max_iter = 300;
    int n_init = 10;
    double agreement_threshold = 0.70;  // adjusted Rand index
    size_t projection_dims = 2;

    // Data-independent checks; throws ConfigurationError naming the field.
    // Bounds that depend on the record count are checked by the clusterers.
    void validate() const;

    TrainConfig train_config() const;
    RankConfig rank_config() const;

    // Clusterer parameters once the centroid k is known.
    ClusterParams cluster_params(int chosen_k) const;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_ENGINE_CONFIG_HPP
