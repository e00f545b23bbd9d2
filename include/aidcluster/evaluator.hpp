#ifndef AIDCLUSTER_EVALUATOR_HPP
#define AIDCLUSTER_EVALUATOR_HPP

#include "types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace aidcluster {

struct Projection {
    size_t n = 0;
    size_t dims = 0;
    std::vector<double> coordinates;         // n x dims, row-major
    std::vector<double> components;          // dims x dim, row-major, unit length
    std::vector<double> explained_variance;  // per component, descending
    std::vector<double> explained_variance_ratio;
};

struct ClusterProfile {
    int cluster_id = 0;
    size_t count = 0;
    std::vector<double> mean;
    std::vector<double> stddev;  // population
    std::vector<std::string> members;  // record ids, matrix order
};

struct ConsistencyReport {
    double score = 0.0;
    double threshold = 0.0;
    bool consistent = false;
};

/**
 * Stateless validation and summary helpers over fitted assignments.
 */
class ClusterEvaluator {
public:
    // PCA of the re-centred features. Each component's largest-magnitude
    // loading is positive. Throws ConfigurationError unless 1 <= dims <= dim.
    static Projection project(const FeatureMatrix& matrix, size_t dims);

    // Keyed by cluster id; noise (-1) gets its own profile when present.
    static std::map<int, ClusterProfile> profile(const ClusterAssignment& assignment,
                                                 const FeatureMatrix& matrix);

    // Adjusted Rand index; agreement(a, a) == 1.0.
    static double agreement(const ClusterAssignment& a, const ClusterAssignment& b);

    static ConsistencyReport check_consistency(const ClusterAssignment& a,
                                               const ClusterAssignment& b,
                                               double threshold);

    // Mean silhouette over non-noise records; NaN when undefined.
    static double silhouette(const ClusterAssignment& assignment,
                             const FeatureMatrix& matrix);
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_EVALUATOR_HPP
