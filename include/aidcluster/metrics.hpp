#ifndef AIDCLUSTER_METRICS_HPP
#define AIDCLUSTER_METRICS_HPP

#include <cstddef>
#include <vector>

namespace aidcluster {

inline double squared_l2(const double* a, const double* b, size_t dim) {
    double s = 0.0;
    for (size_t j = 0; j < dim; ++j) {
        double d = a[j] - b[j];
        s += d * d;
    }
    return s;
}

// n x n Euclidean distance matrix, row-major, via
// ||x - y||^2 = ||x||^2 - 2 x.y + ||y||^2 (cblas_dgemm), clamped at zero.
std::vector<double> pairwise_distances(const double* data, size_t n, size_t dim);

double compute_inertia(const double* data, size_t n, size_t dim,
                       const int* labels, const double* centroids, int k);

void compute_cluster_sizes(const int* labels, size_t n, int k,
                           size_t* out_sizes);

// Mean silhouette coefficient over all points with label >= 0, given a
// precomputed n x n distance matrix. A point alone in its cluster scores 0.
// Returns NaN when the scored points carry fewer than 2 or more than
// (count - 1) distinct labels.
double silhouette_score(const double* distances, const int* labels, size_t n);

// Adjusted Rand index of two labelings of the same n points.
// Noise (-1) is treated as an ordinary label. Identical partitions score 1.
double adjusted_rand_index(const int* a, const int* b, size_t n);

}  // namespace aidcluster

#endif  // AIDCLUSTER_METRICS_HPP
