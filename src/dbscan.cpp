#include "aidcluster/dbscan.hpp"
#include "aidcluster/log.hpp"
#include "aidcluster/metrics.hpp"

#include <cmath>
#include <deque>
#include <utility>

namespace aidcluster {

namespace {

constexpr int kUnvisited = -2;

void check_params(double eps, int min_samples) {
    if (!(eps > 0.0) || !std::isfinite(eps))
        throw ConfigurationError("eps", "must be a positive finite radius, got " +
                                        std::to_string(eps));
    if (min_samples <= 0)
        throw ConfigurationError("min_samples", "must be > 0, got " +
                                                std::to_string(min_samples));
}

}  // namespace

ClusterAssignment DensityClusterer::fit(const FeatureMatrix& matrix,
                                        double eps, int min_samples) {
    check_params(eps, min_samples);

    const size_t n = matrix.rows();
    const size_t dim = matrix.dim();
    const double* data = matrix.data();
    const double eps2 = eps * eps;

    // Each neighbourhood includes the point itself, in ascending index order.
    std::vector<std::vector<size_t>> neighbors(n);
    #pragma omp parallel for schedule(dynamic, 16)
    for (size_t i = 0; i < n; ++i) {
        const double* x = data + i * dim;
        for (size_t j = 0; j < n; ++j) {
            if (squared_l2(x, data + j * dim, dim) <= eps2)
                neighbors[i].push_back(j);
        }
    }

    std::vector<char> core(n, 0);
    for (size_t i = 0; i < n; ++i)
        core[i] = neighbors[i].size() >= static_cast<size_t>(min_samples);

    std::vector<int> labels(n, kUnvisited);
    int cluster_id = 0;
    std::deque<size_t> frontier;

    for (size_t i = 0; i < n; ++i) {
        if (labels[i] != kUnvisited || !core[i]) continue;

        labels[i] = cluster_id;
        frontier.push_back(i);
        while (!frontier.empty()) {
            size_t p = frontier.front();
            frontier.pop_front();
            for (size_t q : neighbors[p]) {
                if (labels[q] != kUnvisited) continue;
                labels[q] = cluster_id;
                if (core[q]) frontier.push_back(q);
            }
        }
        ++cluster_id;
    }

    for (auto& l : labels)
        if (l == kUnvisited) l = kNoiseLabel;

    DensityModel model;
    model.eps = eps;
    model.min_samples = min_samples;
    model.dim = dim;
    for (size_t i = 0; i < n; ++i) {
        if (!core[i]) continue;
        model.core_points.insert(model.core_points.end(), data + i * dim, data + i * dim + dim);
        model.core_labels.push_back(labels[i]);
    }
    model_ = std::move(model);

    ClusterAssignment out;
    out.algorithm = name();
    out.ids = matrix.ids();
    out.labels = std::move(labels);
    out.n_clusters = cluster_id;

    AC_LOG_INFO("dbscan", "eps=%.4g min_samples=%d: %d clusters, %zu noise points",
                eps, min_samples, cluster_id, out.noise_count());
    return out;
}

ClusterAssignment DensityClusterer::fit(const FeatureMatrix& matrix,
                                        const ClusterParams& params) {
    return fit(matrix, params.eps, params.min_samples);
}

std::vector<int> DensityClusterer::predict(const FeatureMatrix& matrix) const {
    if (!is_fitted())
        throw ConfigurationError("model", "predict called before fit");
    if (matrix.dim() != model_.dim)
        throw ConfigurationError("dim", "model has " + std::to_string(model_.dim) +
                                        " dimensions, matrix has " +
                                        std::to_string(matrix.dim()));

    const size_t n = matrix.rows();
    const size_t dim = model_.dim;
    const size_t n_core = model_.n_core();
    const double eps2 = model_.eps * model_.eps;
    std::vector<int> labels(n, kNoiseLabel);

    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        const double* x = matrix.row(i);
        double best = eps2;
        for (size_t c = 0; c < n_core; ++c) {
            double d2 = squared_l2(x, model_.core_points.data() + c * dim, dim);
            if (d2 <= eps2 && (labels[i] == kNoiseLabel || d2 < best)) {
                best = d2;
                labels[i] = model_.core_labels[c];
            }
        }
    }
    return labels;
}

void DensityClusterer::load_model(DensityModel model) {
    check_params(model.eps, model.min_samples);
    if (model.dim == 0 || model.core_points.size() != model.n_core() * model.dim)
        throw ConfigurationError("model", "core point block does not match n_core x dim");
    model_ = std::move(model);
}

}  // namespace aidcluster
