#ifndef AIDCLUSTER_RANKER_HPP
#define AIDCLUSTER_RANKER_HPP

#include "evaluator.hpp"
#include "types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace aidcluster {

struct FeatureWeight {
    std::string name;
    double weight;
};

// Child mortality and fertility push priority up; income, life expectancy
// and GDP per capita push it down.
std::vector<FeatureWeight> default_vulnerability_weights();

struct RankConfig {
    std::vector<FeatureWeight> weights = default_vulnerability_weights();
    double high_threshold = 0.5;   // score > high  -> High
    double low_threshold = -0.5;   // score < low   -> Low
};

enum class Tier { High, Medium, Low, Review };

const char* tier_name(Tier tier);

struct PriorityEntry {
    std::string id;
    int cluster_id = 0;
    double score = 0.0;
    double cluster_score = 0.0;  // score of the cluster's mean vector; NaN for unprofiled noise
    Tier tier = Tier::Medium;
    size_t rank = 0;             // 1-based
};

struct ClusterPriority {
    int cluster_id = 0;
    size_t size = 0;
    double score = 0.0;
    Tier tier = Tier::Medium;
    size_t rank = 0;
};

// Records in the top-ranked centroid cluster or the top-ranked
// hierarchical cluster.
struct AidPrioritySet {
    int centroid_cluster = kNoiseLabel;
    int hierarchical_cluster = kNoiseLabel;
    std::vector<std::string> ids;  // ascending, no duplicates
};

/**
 * Composite vulnerability scoring.
 * A record's score is sum(weight_f * x_f) over the configured features.
 * Entries are ordered by score descending, then id ascending. Noise records
 * are never tiered automatically and get Tier::Review.
 */
class PriorityRanker {
public:
    // Throws ConfigurationError naming tier_thresholds when low > high.
    explicit PriorityRanker(RankConfig cfg = {});

    std::vector<PriorityEntry> rank(const ClusterAssignment& assignment,
                                    const FeatureMatrix& matrix,
                                    const std::map<int, ClusterProfile>& profiles) const;

    // Non-noise clusters by profile score descending, ties by cluster id.
    std::vector<ClusterPriority> rank_clusters(const std::map<int, ClusterProfile>& profiles,
                                               const std::vector<std::string>& feature_names) const;

    // Union of the rank-1 cluster of each ranking. Both assignments must
    // cover the same records in the same order.
    static AidPrioritySet aid_priority_set(const ClusterAssignment& centroid,
                                           const std::vector<ClusterPriority>& centroid_ranking,
                                           const ClusterAssignment& hierarchical,
                                           const std::vector<ClusterPriority>& hierarchical_ranking);

    Tier tier_for(double score) const;
    const RankConfig& config() const { return cfg_; }

private:
    // (column, weight) per configured feature; unknown names throw.
    std::vector<std::pair<size_t, double>> resolve(const std::vector<std::string>& feature_names) const;

    RankConfig cfg_;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_RANKER_HPP
