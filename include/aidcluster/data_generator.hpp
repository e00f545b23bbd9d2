#ifndef AIDCLUSTER_DATA_GENERATOR_HPP
#define AIDCLUSTER_DATA_GENERATOR_HPP

#include "types.hpp"

#include <cstddef>
#include <vector>

namespace aidcluster {

// Mixture-of-Gaussians synthetic records for tests and benchmarking.
// Centres are uniform in [-spread, spread]^dim, per-cluster scale uniform in
// [0.5, 1.5]. Points are assigned round-robin, so record i belongs to
// Gaussian i % num_gaussians. Ids are "r<index>", features "f<index>".
FeatureMatrix generate_gaussian_mixture(size_t n, size_t dim, int num_gaussians,
                                        unsigned seed, double spread = 10.0);

// Ground-truth component of each record produced above.
std::vector<int> generate_ground_truth_labels(size_t n, int num_gaussians);

}  // namespace aidcluster

#endif  // AIDCLUSTER_DATA_GENERATOR_HPP
