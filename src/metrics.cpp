#include "aidcluster/metrics.hpp"

#include <cblas.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <map>
#include <utility>

namespace aidcluster {

namespace {

inline double comb2(double x) { return x * (x - 1.0) / 2.0; }

}  // namespace

std::vector<double> pairwise_distances(const double* data, size_t n, size_t dim) {
    std::vector<double> dist(n * n, 0.0);
    if (n == 0) return dist;

    std::vector<double> norms(n);
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        const double* x = data + i * dim;
        double s = 0.0;
        for (size_t j = 0; j < dim; ++j) s += x[j] * x[j];
        norms[i] = s;
    }

    // dist = -2 * X X^T
    cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasTrans,
                static_cast<int>(n),
                static_cast<int>(n),
                static_cast<int>(dim),
                -2.0,
                data, static_cast<int>(dim),
                data, static_cast<int>(dim),
                0.0,
                dist.data(), static_cast<int>(n));

    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        double* row = dist.data() + i * n;
        for (size_t j = 0; j < n; ++j) {
            double d2 = row[j] + norms[i] + norms[j];
            row[j] = d2 > 0.0 ? std::sqrt(d2) : 0.0;
        }
        row[i] = 0.0;
    }

    // Symmetrise so d(i, j) == d(j, i) bit for bit.
    for (size_t i = 0; i < n; ++i)
        for (size_t j = i + 1; j < n; ++j)
            dist[j * n + i] = dist[i * n + j];

    return dist;
}

double compute_inertia(const double* data, size_t n, size_t dim,
                       const int* labels, const double* centroids, int k) {
    // Sequential sum keeps the result independent of thread count.
    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
        int l = labels[i];
        if (l < 0 || l >= k) continue;
        total += squared_l2(data + i * dim, centroids + static_cast<size_t>(l) * dim, dim);
    }
    return total;
}

void compute_cluster_sizes(const int* labels, size_t n, int k,
                           size_t* out_sizes) {
    std::memset(out_sizes, 0, static_cast<size_t>(k) * sizeof(size_t));
    for (size_t i = 0; i < n; ++i) {
        int l = labels[i];
        if (l >= 0 && l < k)
            out_sizes[static_cast<size_t>(l)]++;
    }
}

double silhouette_score(const double* distances, const int* labels, size_t n) {
    int n_labels = 0;
    size_t scored = 0;
    for (size_t i = 0; i < n; ++i) {
        if (labels[i] < 0) continue;
        n_labels = std::max(n_labels, labels[i] + 1);
        ++scored;
    }

    std::vector<size_t> sizes(static_cast<size_t>(n_labels), 0);
    compute_cluster_sizes(labels, n, n_labels, sizes.data());
    int distinct = 0;
    for (size_t s : sizes)
        if (s > 0) ++distinct;
    if (distinct < 2 || static_cast<size_t>(distinct) > scored - 1)
        return std::numeric_limits<double>::quiet_NaN();

    std::vector<double> s(n, 0.0);
    #pragma omp parallel for schedule(dynamic, 16)
    for (size_t i = 0; i < n; ++i) {
        int li = labels[i];
        if (li < 0) continue;
        if (sizes[static_cast<size_t>(li)] <= 1) { s[i] = 0.0; continue; }

        std::vector<double> sums(static_cast<size_t>(n_labels), 0.0);
        const double* row = distances + i * n;
        for (size_t j = 0; j < n; ++j) {
            int lj = labels[j];
            if (lj < 0 || j == i) continue;
            sums[static_cast<size_t>(lj)] += row[j];
        }

        double a = sums[static_cast<size_t>(li)] /
                   static_cast<double>(sizes[static_cast<size_t>(li)] - 1);
        double b = std::numeric_limits<double>::max();
        for (int c = 0; c < n_labels; ++c) {
            if (c == li || sizes[static_cast<size_t>(c)] == 0) continue;
            b = std::min(b, sums[static_cast<size_t>(c)] /
                            static_cast<double>(sizes[static_cast<size_t>(c)]));
        }
        double m = std::max(a, b);
        s[i] = m > 0.0 ? (b - a) / m : 0.0;
    }

    double total = 0.0;
    for (size_t i = 0; i < n; ++i)
        if (labels[i] >= 0) total += s[i];
    return total / static_cast<double>(scored);
}

double adjusted_rand_index(const int* a, const int* b, size_t n) {
    if (n < 2) return 1.0;

    std::map<std::pair<int, int>, double> contingency;
    std::map<int, double> rows, cols;
    for (size_t i = 0; i < n; ++i) {
        contingency[{a[i], b[i]}] += 1.0;
        rows[a[i]] += 1.0;
        cols[b[i]] += 1.0;
    }

    double sum_comb = 0.0;
    for (const auto& kv : contingency) sum_comb += comb2(kv.second);
    double sum_a = 0.0;
    for (const auto& kv : rows) sum_a += comb2(kv.second);
    double sum_b = 0.0;
    for (const auto& kv : cols) sum_b += comb2(kv.second);

    double expected = sum_a * sum_b / comb2(static_cast<double>(n));
    double max_index = (sum_a + sum_b) / 2.0;
    double denom = max_index - expected;
    if (denom == 0.0) return 1.0;
    return (sum_comb - expected) / denom;
}

}  // namespace aidcluster
