#ifndef AIDCLUSTER_ICLUSTERER_HPP
#define AIDCLUSTER_ICLUSTERER_HPP

#include "types.hpp"

#include <cstddef>
#include <string>

namespace aidcluster {

struct ClusterParams {
    int k = 0;              // centroid: 0 = choose by silhouette over [k_min, k_max]
    int k_min = 2;
    int k_max = 10;
    int linkage_cut_k = 3;  // hierarchical cut
    double eps = 1.5;       // density radius
    int min_samples = 3;    // density core threshold, point itself included
};

/**
 * Capability shared by the centroid, hierarchical and density clusterers.
 * fit() never mutates the matrix; the fitted model stays private to the
 * clusterer and is replaced by the next fit() call.
 */
class IClusterer {
public:
    virtual ClusterAssignment fit(const FeatureMatrix& matrix,
                                  const ClusterParams& params) = 0;

    virtual std::string name() const = 0;

    virtual ~IClusterer() = default;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_ICLUSTERER_HPP
