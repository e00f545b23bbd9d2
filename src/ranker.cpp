#include "aidcluster/ranker.hpp"
#include "aidcluster/log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <utility>

namespace aidcluster {

std::vector<FeatureWeight> default_vulnerability_weights() {
    return {
        {"child_mort", 1.0},
        {"total_fer", 0.5},
        {"income", -0.5},
        {"life_expec", -0.5},
        {"gdpp", -0.5},
    };
}

const char* tier_name(Tier tier) {
    switch (tier) {
    case Tier::High:   return "HIGH";
    case Tier::Medium: return "MEDIUM";
    case Tier::Low:    return "LOW";
    case Tier::Review: return "REVIEW";
    }
    return "UNKNOWN";
}

PriorityRanker::PriorityRanker(RankConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.weights.empty())
        throw ConfigurationError("vulnerability_weights", "at least one feature weight is required");
    std::set<std::string> seen;
    for (const auto& w : cfg_.weights) {
        if (!std::isfinite(w.weight))
            throw ConfigurationError("vulnerability_weights",
                                     "weight for '" + w.name + "' is not finite");
        if (!seen.insert(w.name).second)
            throw ConfigurationError("vulnerability_weights",
                                     "feature '" + w.name + "' weighted twice");
    }
    if (!std::isfinite(cfg_.low_threshold) || !std::isfinite(cfg_.high_threshold) ||
        cfg_.low_threshold > cfg_.high_threshold)
        throw ConfigurationError("tier_thresholds",
                                 "need finite low <= high, got low=" +
                                 std::to_string(cfg_.low_threshold) + " high=" +
                                 std::to_string(cfg_.high_threshold));
}

std::vector<std::pair<size_t, double>>
PriorityRanker::resolve(const std::vector<std::string>& feature_names) const {
    std::vector<std::pair<size_t, double>> out;
    out.reserve(cfg_.weights.size());
    for (const auto& w : cfg_.weights) {
        auto it = std::find(feature_names.begin(), feature_names.end(), w.name);
        if (it == feature_names.end())
            throw ConfigurationError("vulnerability_weights",
                                     "unknown feature '" + w.name + "'");
        out.emplace_back(static_cast<size_t>(it - feature_names.begin()), w.weight);
    }
    return out;
}

Tier PriorityRanker::tier_for(double score) const {
    if (score > cfg_.high_threshold) return Tier::High;
    if (score < cfg_.low_threshold) return Tier::Low;
    return Tier::Medium;
}

namespace {

double weighted_sum(const double* x, const std::vector<std::pair<size_t, double>>& w) {
    double s = 0.0;
    for (const auto& cw : w) s += cw.second * x[cw.first];
    return s;
}

}  // namespace

std::vector<PriorityEntry>
PriorityRanker::rank(const ClusterAssignment& assignment,
                     const FeatureMatrix& matrix,
                     const std::map<int, ClusterProfile>& profiles) const {
    if (assignment.size() != matrix.rows() || assignment.ids != matrix.ids())
        throw ConfigurationError("assignment", "does not describe the matrix records in matrix order");

    const auto weights = resolve(matrix.feature_names());

    std::map<int, double> cluster_scores;
    for (int label : assignment.labels) {
        if (cluster_scores.count(label)) continue;
        auto it = profiles.find(label);
        if (it == profiles.end()) {
            if (label == kNoiseLabel) {
                cluster_scores[label] = std::numeric_limits<double>::quiet_NaN();
                continue;
            }
            throw ConfigurationError("profiles", "no profile for cluster " + std::to_string(label));
        }
        if (it->second.mean.size() != matrix.dim())
            throw ConfigurationError("profiles", "profile for cluster " + std::to_string(label) +
                                                 " has the wrong dimensionality");
        cluster_scores[label] = weighted_sum(it->second.mean.data(), weights);
    }

    std::vector<PriorityEntry> entries(matrix.rows());
    for (size_t i = 0; i < matrix.rows(); ++i) {
        PriorityEntry& e = entries[i];
        e.id = matrix.id(i);
        e.cluster_id = assignment.labels[i];
        e.score = weighted_sum(matrix.row(i), weights);
        e.cluster_score = cluster_scores[e.cluster_id];
        e.tier = e.cluster_id == kNoiseLabel ? Tier::Review : tier_for(e.score);
    }

    std::sort(entries.begin(), entries.end(), [](const PriorityEntry& a, const PriorityEntry& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    });
    for (size_t i = 0; i < entries.size(); ++i) entries[i].rank = i + 1;

    AC_LOG_INFO("ranker", "ranked %zu records from %s, top=%s (%.4f)",
                entries.size(), assignment.algorithm.c_str(),
                entries.front().id.c_str(), entries.front().score);
    return entries;
}

std::vector<ClusterPriority>
PriorityRanker::rank_clusters(const std::map<int, ClusterProfile>& profiles,
                              const std::vector<std::string>& feature_names) const {
    const auto weights = resolve(feature_names);

    std::vector<ClusterPriority> out;
    for (const auto& kv : profiles) {
        if (kv.first == kNoiseLabel) continue;
        if (kv.second.mean.size() != feature_names.size())
            throw ConfigurationError("profiles", "profile for cluster " + std::to_string(kv.first) +
                                                 " has the wrong dimensionality");
        ClusterPriority cp;
        cp.cluster_id = kv.first;
        cp.size = kv.second.count;
        cp.score = weighted_sum(kv.second.mean.data(), weights);
        cp.tier = tier_for(cp.score);
        out.push_back(cp);
    }

    std::sort(out.begin(), out.end(), [](const ClusterPriority& a, const ClusterPriority& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.cluster_id < b.cluster_id;
    });
    for (size_t i = 0; i < out.size(); ++i) out[i].rank = i + 1;
    return out;
}

AidPrioritySet
PriorityRanker::aid_priority_set(const ClusterAssignment& centroid,
                                 const std::vector<ClusterPriority>& centroid_ranking,
                                 const ClusterAssignment& hierarchical,
                                 const std::vector<ClusterPriority>& hierarchical_ranking) {
    if (centroid_ranking.empty() || hierarchical_ranking.empty())
        throw ConfigurationError("profiles", "both cluster rankings must be non-empty");
    if (centroid.ids != hierarchical.ids || centroid.size() != hierarchical.size())
        throw ConfigurationError("assignment", "assignments cover different records");

    AidPrioritySet out;
    out.centroid_cluster = centroid_ranking.front().cluster_id;
    out.hierarchical_cluster = hierarchical_ranking.front().cluster_id;
    for (size_t i = 0; i < centroid.size(); ++i) {
        if (centroid.labels[i] == out.centroid_cluster ||
            hierarchical.labels[i] == out.hierarchical_cluster)
            out.ids.push_back(centroid.ids[i]);
    }
    std::sort(out.ids.begin(), out.ids.end());

    AC_LOG_INFO("ranker", "aid set: %s cluster %d + %s cluster %d -> %zu records",
                centroid.algorithm.c_str(), out.centroid_cluster,
                hierarchical.algorithm.c_str(), out.hierarchical_cluster, out.ids.size());
    return out;
}

}  // namespace aidcluster
