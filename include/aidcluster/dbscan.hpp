#ifndef AIDCLUSTER_DBSCAN_HPP
#define AIDCLUSTER_DBSCAN_HPP

#include "iclusterer.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace aidcluster {

// Fitted density state: the core points and the cluster each belongs to.
struct DensityModel {
    double eps = 0.0;
    int min_samples = 0;
    size_t dim = 0;
    std::vector<double> core_points;  // n_core x dim, row-major
    std::vector<int> core_labels;

    size_t n_core() const { return core_labels.size(); }
};

/**
 * DBSCAN over Euclidean distance.
 * A core point has at least min_samples points (itself included) within eps.
 * Clusters are numbered in the order their first core point appears in the
 * record sequence; border points join the first cluster that reaches them;
 * everything else is kNoiseLabel.
 */
class DensityClusterer : public IClusterer {
public:
    ClusterAssignment fit(const FeatureMatrix& matrix, double eps, int min_samples);

    ClusterAssignment fit(const FeatureMatrix& matrix,
                          const ClusterParams& params) override;

    // Label of the nearest core point within eps, else kNoiseLabel.
    std::vector<int> predict(const FeatureMatrix& matrix) const;

    bool is_fitted() const { return model_.min_samples > 0; }
    const DensityModel& model() const { return model_; }
    void load_model(DensityModel model);

    std::string name() const override { return "dbscan"; }

private:
    DensityModel model_;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_DBSCAN_HPP
