#include "aidcluster/engine_config.hpp"

#include <cmath>
#include <string>

namespace aidcluster {

void EngineConfig::validate() const {
    if (k_min < 1)
        throw ConfigurationError("k_min", "must be >= 1, got " + std::to_string(k_min));
    if (k_max < k_min)
        throw ConfigurationError("k_max", "must be >= k_min, got " + std::to_string(k_max));
    if (k && *k < 1)
        throw ConfigurationError("k", "must be >= 1, got " + std::to_string(*k));
    if (linkage_cut_k && *linkage_cut_k < 1)
        throw ConfigurationError("linkage_cut_k", "must be >= 1, got " +
                                                  std::to_string(*linkage_cut_k));
    if (!(eps > 0.0) || !std::isfinite(eps))
        throw ConfigurationError("eps", "must be a positive finite radius");
    if (min_samples <= 0)
        throw ConfigurationError("min_samples", "must be > 0, got " + std::to_string(min_samples));
    if (max_iter == 0)
        throw ConfigurationError("max_iter", "must be > 0");
    if (n_init < 1)
        throw ConfigurationError("n_init", "must be >= 1, got " + std::to_string(n_init));
    if (!std::isfinite(agreement_threshold) || agreement_threshold < -1.0 ||
        agreement_threshold > 1.0)
        throw ConfigurationError("agreement_threshold", "must be in [-1, 1]");
    if (projection_dims < 1)
        throw ConfigurationError("projection_dims", "must be >= 1");

    // Weight and tier checks live with the ranker.
    PriorityRanker check(rank_config());
    (void)check;
}

TrainConfig EngineConfig::train_config() const {
    TrainConfig cfg;
    cfg.max_iter = max_iter;
    cfg.n_init = n_init;
    cfg.seed = random_seed;
    return cfg;
}

RankConfig EngineConfig::rank_config() const {
    RankConfig cfg;
    cfg.weights = vulnerability_weights;
    cfg.high_threshold = tier_high;
    cfg.low_threshold = tier_low;
    return cfg;
}

ClusterParams EngineConfig::cluster_params(int chosen_k) const {
    ClusterParams p;
    p.k = chosen_k;
    p.k_min = k_min;
    p.k_max = k_max;
    p.linkage_cut_k = linkage_cut_k ? *linkage_cut_k : chosen_k;
    p.eps = eps;
    p.min_samples = min_samples;
    return p;
}

}  // namespace aidcluster
