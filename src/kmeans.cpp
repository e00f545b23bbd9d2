#include "aidcluster/kmeans.hpp"
#include "aidcluster/log.hpp"
#include "aidcluster/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <numeric>
#include <random>
#include <utility>

namespace aidcluster {

namespace {

struct Solution {
    std::vector<double> centroids;  // k x dim
    std::vector<int> labels;
    double inertia = 0.0;
    int iterations = 0;
    bool converged = false;
};

// Lexicographic order on centroid coordinates.
bool coords_less(const double* a, const double* b, size_t dim) {
    return std::lexicographical_compare(a, a + dim, b, b + dim);
}

// Nearest centroid per point. Exact distance ties go to the centroid with
// the lexicographically smaller coordinates, so the result does not depend
// on centroid order; only coincident centroids fall back to the lower index.
void assign_labels(const double* data, size_t n, size_t dim,
                   const double* centroids, int k, int* labels) {
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        const double* x = data + i * dim;
        int best = 0;
        double best_d = squared_l2(x, centroids, dim);
        for (int c = 1; c < k; ++c) {
            const double* cv = centroids + static_cast<size_t>(c) * dim;
            double d2 = squared_l2(x, cv, dim);
            if (d2 < best_d ||
                (d2 == best_d &&
                 coords_less(cv, centroids + static_cast<size_t>(best) * dim, dim))) {
                best_d = d2;
                best = c;
            }
        }
        labels[i] = best;
    }
}

void kmeanspp_init(const double* data, size_t n, size_t dim, int k,
                   std::mt19937& rng, std::vector<double>& centroids) {
    centroids.assign(static_cast<size_t>(k) * dim, 0.0);

    std::uniform_int_distribution<size_t> uidx(0, n - 1);
    size_t first = uidx(rng);
    std::memcpy(centroids.data(), data + first * dim, dim * sizeof(double));

    std::vector<double> min_dist(n);
    for (size_t i = 0; i < n; ++i)
        min_dist[i] = squared_l2(data + i * dim, centroids.data(), dim);

    for (int cc = 1; cc < k; ++cc) {
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) total += min_dist[i];
        if (total <= 0.0) total = 1.0;

        std::uniform_real_distribution<double> u(0.0, total);
        double r = u(rng);
        size_t chosen = 0;
        for (; chosen < n && r >= 0.0; ++chosen) r -= min_dist[chosen];
        if (chosen > 0) chosen--;
        chosen = std::min(chosen, n - 1);

        double* c_new = centroids.data() + static_cast<size_t>(cc) * dim;
        std::memcpy(c_new, data + chosen * dim, dim * sizeof(double));

        for (size_t i = 0; i < n; ++i) {
            double d = squared_l2(data + i * dim, c_new, dim);
            if (d < min_dist[i]) min_dist[i] = d;
        }
    }
}

// Index of the point farthest from its assigned centroid (lowest index on
// ties), skipping points flagged in `taken`.
size_t farthest_point(const double* data, size_t n, size_t dim,
                      const double* centroids, const int* labels,
                      const std::vector<char>& taken) {
    size_t best = n;
    double best_d = -1.0;
    for (size_t i = 0; i < n; ++i) {
        if (taken[i]) continue;
        double d = squared_l2(data + i * dim,
                              centroids + static_cast<size_t>(labels[i]) * dim, dim);
        if (d > best_d) { best_d = d; best = i; }
    }
    return best;
}

// Means of the assigned points, accumulated in record order. A centroid
// that lost all its points moves onto the farthest remaining point.
void update_centroids(const double* data, size_t n, size_t dim, int k,
                      const int* labels, std::vector<double>& centroids) {
    std::vector<double> sums(static_cast<size_t>(k) * dim, 0.0);
    std::vector<size_t> counts(static_cast<size_t>(k), 0);
    for (size_t i = 0; i < n; ++i) {
        double* s = sums.data() + static_cast<size_t>(labels[i]) * dim;
        const double* x = data + i * dim;
        for (size_t j = 0; j < dim; ++j) s[j] += x[j];
        counts[static_cast<size_t>(labels[i])]++;
    }

    std::vector<double> previous = centroids;
    std::vector<char> taken(n, 0);
    for (int c = 0; c < k; ++c) {
        double* cv = centroids.data() + static_cast<size_t>(c) * dim;
        size_t cnt = counts[static_cast<size_t>(c)];
        if (cnt == 0) {
            size_t far = farthest_point(data, n, dim, previous.data(), labels, taken);
            if (far < n) {
                taken[far] = 1;
                std::memcpy(cv, data + far * dim, dim * sizeof(double));
            }
            continue;
        }
        const double* s = sums.data() + static_cast<size_t>(c) * dim;
        double inv = 1.0 / static_cast<double>(cnt);
        for (size_t j = 0; j < dim; ++j) cv[j] = s[j] * inv;
    }
}

Solution run_lloyd(const double* data, size_t n, size_t dim, int k,
                   std::vector<double> init, size_t max_iter) {
    Solution sol;
    sol.centroids = std::move(init);
    sol.labels.resize(n);
    std::vector<int> next(n);

    assign_labels(data, n, dim, sol.centroids.data(), k, sol.labels.data());
    for (size_t iter = 0; iter < max_iter; ++iter) {
        update_centroids(data, n, dim, k, sol.labels.data(), sol.centroids);
        assign_labels(data, n, dim, sol.centroids.data(), k, next.data());
        sol.iterations = static_cast<int>(iter + 1);
        if (next == sol.labels) {
            sol.converged = true;
            break;
        }
        sol.labels.swap(next);
    }

    sol.inertia = compute_inertia(data, n, dim, sol.labels.data(),
                                  sol.centroids.data(), k);
    return sol;
}

// n_init restarts drawn from one seeded stream; earliest restart wins ties.
Solution train_best(const double* data, size_t n, size_t dim, int k,
                    const TrainConfig& cfg) {
    std::mt19937 rng(cfg.seed);
    Solution best;
    int restarts = std::max(1, cfg.n_init);
    for (int r = 0; r < restarts; ++r) {
        std::vector<double> init;
        kmeanspp_init(data, n, dim, k, rng, init);
        Solution sol = run_lloyd(data, n, dim, k, std::move(init), cfg.max_iter);
        if (r == 0 || sol.inertia < best.inertia) best = std::move(sol);
    }
    return best;
}

// Warm start for k + 1: previous centroids plus the point farthest from
// its own centroid. Lloyd from here cannot end above prev.inertia.
Solution refine_from(const double* data, size_t n, size_t dim,
                     const Solution& prev, int k, size_t max_iter) {
    std::vector<char> taken(n, 0);
    size_t far = farthest_point(data, n, dim, prev.centroids.data(),
                                prev.labels.data(), taken);
    std::vector<double> init = prev.centroids;
    init.insert(init.end(), data + far * dim, data + far * dim + dim);
    return run_lloyd(data, n, dim, k, std::move(init), max_iter);
}

// Cluster ids by descending size, ties by lowest first-member index.
// Returns old -> new id and the count of non-empty clusters.
std::vector<int> size_order(const std::vector<int>& labels, int k, int* non_empty) {
    size_t n = labels.size();
    std::vector<size_t> sizes(static_cast<size_t>(k), 0);
    std::vector<size_t> first(static_cast<size_t>(k), n);
    for (size_t i = 0; i < n; ++i) {
        size_t l = static_cast<size_t>(labels[i]);
        sizes[l]++;
        if (first[l] == n) first[l] = i;
    }

    std::vector<int> order(static_cast<size_t>(k));
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](int a, int b) {
        size_t ua = static_cast<size_t>(a), ub = static_cast<size_t>(b);
        if (sizes[ua] != sizes[ub]) return sizes[ua] > sizes[ub];
        if (first[ua] != first[ub]) return first[ua] < first[ub];
        return a < b;
    });

    std::vector<int> remap(static_cast<size_t>(k));
    *non_empty = 0;
    for (int pos = 0; pos < k; ++pos) {
        remap[static_cast<size_t>(order[static_cast<size_t>(pos)])] = pos;
        if (sizes[static_cast<size_t>(order[static_cast<size_t>(pos)])] > 0) ++*non_empty;
    }
    return remap;
}

void check_k(int k, size_t n) {
    if (k < 1)
        throw ConfigurationError("k", "must be >= 1, got " + std::to_string(k));
    if (static_cast<size_t>(k) > n)
        throw ConfigurationError("k", "k=" + std::to_string(k) +
                                      " exceeds record count " + std::to_string(n));
}

struct SearchState {
    std::vector<Solution> sols;  // index k - k_min
    KSearchResult result;
};

SearchState run_search(const FeatureMatrix& matrix, int k_min, int k_max,
                       const TrainConfig& cfg) {
    const size_t n = matrix.rows();
    const size_t dim = matrix.dim();
    if (k_min < 1)
        throw ConfigurationError("k_min", "must be >= 1, got " + std::to_string(k_min));
    if (k_max < k_min)
        throw ConfigurationError("k_max", "must be >= k_min (" + std::to_string(k_min) +
                                          "), got " + std::to_string(k_max));
    if (static_cast<size_t>(k_max) > n)
        throw ConfigurationError("k_max", "k_max=" + std::to_string(k_max) +
                                          " exceeds record count " + std::to_string(n));

    const int count = k_max - k_min + 1;
    const double* data = matrix.data();
    SearchState state;
    std::vector<Solution>& sols = state.sols;
    sols.resize(static_cast<size_t>(count));

    #pragma omp parallel for schedule(dynamic, 1)
    for (int idx = 0; idx < count; ++idx)
        sols[static_cast<size_t>(idx)] = train_best(data, n, dim, k_min + idx, cfg);

    for (int idx = 1; idx < count; ++idx) {
        Solution& cur = sols[static_cast<size_t>(idx)];
        const Solution& prev = sols[static_cast<size_t>(idx - 1)];
        if (cur.inertia > prev.inertia) {
            AC_LOG_DEBUG("kmeans", "k=%d inertia %.6g above k=%d (%.6g), refining from warm start",
                         k_min + idx, cur.inertia, k_min + idx - 1, prev.inertia);
            cur = refine_from(data, n, dim, prev, k_min + idx, cfg.max_iter);
        }
    }

    std::vector<double> dist = pairwise_distances(data, n, dim);
    std::vector<double> sil(static_cast<size_t>(count),
                            std::numeric_limits<double>::quiet_NaN());
    #pragma omp parallel for schedule(dynamic, 1)
    for (int idx = 0; idx < count; ++idx) {
        if (k_min + idx < 2) continue;
        sil[static_cast<size_t>(idx)] =
            silhouette_score(dist.data(), sols[static_cast<size_t>(idx)].labels.data(), n);
    }

    KSearchResult& result = state.result;
    result.scores.reserve(static_cast<size_t>(count));
    double best_sil = 0.0;
    for (int idx = 0; idx < count; ++idx) {
        const Solution& s = sols[static_cast<size_t>(idx)];
        int k = k_min + idx;
        double sc = sil[static_cast<size_t>(idx)];
        result.scores.push_back({k, s.inertia, sc, s.converged});
        AC_LOG_DEBUG("kmeans", "search k=%d inertia=%.6g silhouette=%.6f iters=%d",
                     k, s.inertia, sc, s.iterations);
        if (k >= 2 && !std::isnan(sc) && (!result.best_k || sc > best_sil)) {
            result.best_k = k;
            best_sil = sc;
        }
    }

    if (result.best_k)
        AC_LOG_INFO("kmeans", "search over k=[%d, %d] selected k=%d (silhouette %.4f)",
                    k_min, k_max, *result.best_k, best_sil);
    return state;
}

// Relabels a trained solution by size, stores it as the fitted model and
// builds the assignment.
ClusterAssignment finish_fit(const FeatureMatrix& matrix, const Solution& sol, int k,
                             const TrainConfig& cfg, const std::string& algorithm,
                             KMeansModel& model_out) {
    const size_t n = matrix.rows();
    const size_t dim = matrix.dim();

    int non_empty = 0;
    std::vector<int> remap = size_order(sol.labels, k, &non_empty);

    KMeansModel model;
    model.k = k;
    model.dim = dim;
    model.centroids.resize(static_cast<size_t>(k) * dim);
    for (int c = 0; c < k; ++c) {
        size_t dst = static_cast<size_t>(remap[static_cast<size_t>(c)]);
        std::memcpy(model.centroids.data() + dst * dim,
                    sol.centroids.data() + static_cast<size_t>(c) * dim,
                    dim * sizeof(double));
    }
    model.inertia = sol.inertia;
    model.iterations = sol.iterations;
    model.converged = sol.converged;
    model.seed = cfg.seed;
    model_out = std::move(model);

    ClusterAssignment out;
    out.algorithm = algorithm;
    out.ids = matrix.ids();
    out.labels.resize(n);
    for (size_t i = 0; i < n; ++i)
        out.labels[i] = remap[static_cast<size_t>(sol.labels[i])];
    out.n_clusters = non_empty;
    out.iterations = sol.iterations;

    if (!sol.converged) {
        ConvergenceWarning w;
        w.iterations = sol.iterations;
        w.max_iter = cfg.max_iter;
        w.message = "k-means did not stabilise within " + std::to_string(cfg.max_iter) +
                    " iterations (k=" + std::to_string(k) + ", seed=" +
                    std::to_string(cfg.seed) + ")";
        AC_LOG_WARN("kmeans", "%s", w.message.c_str());
        out.warning = std::move(w);
    }

    AC_LOG_INFO("kmeans", "fit k=%d n=%zu inertia=%.6g iterations=%d",
                k, n, sol.inertia, sol.iterations);
    return out;
}

}  // namespace

CentroidClusterer::CentroidClusterer(const TrainConfig& cfg) : cfg_(cfg) {
    if (cfg_.max_iter == 0)
        throw ConfigurationError("max_iter", "must be > 0");
    if (cfg_.n_init < 1)
        throw ConfigurationError("n_init", "must be >= 1");
}

KSearchResult CentroidClusterer::search_k(const FeatureMatrix& matrix,
                                          int k_min, int k_max) const {
    return run_search(matrix, k_min, k_max, cfg_).result;
}

ClusterAssignment CentroidClusterer::fit(const FeatureMatrix& matrix, int k) {
    check_k(k, matrix.rows());
    Solution sol = train_best(matrix.data(), matrix.rows(), matrix.dim(), k, cfg_);
    return finish_fit(matrix, sol, k, cfg_, name(), model_);
}

ClusterAssignment CentroidClusterer::fit_best(const FeatureMatrix& matrix,
                                              int k_min, int k_max,
                                              KSearchResult* search) {
    SearchState state = run_search(matrix, k_min, k_max, cfg_);
    if (!state.result.best_k)
        throw ConfigurationError("k_max", "no candidate k >= 2 with a defined silhouette in [" +
                                          std::to_string(k_min) + ", " +
                                          std::to_string(k_max) + "]");
    const int k = *state.result.best_k;
    ClusterAssignment out = finish_fit(matrix, state.sols[static_cast<size_t>(k - k_min)],
                                       k, cfg_, name(), model_);
    if (search) *search = std::move(state.result);
    return out;
}

ClusterAssignment CentroidClusterer::fit(const FeatureMatrix& matrix,
                                         const ClusterParams& params) {
    if (params.k > 0)
        return fit(matrix, params.k);
    return fit_best(matrix, params.k_min, params.k_max);
}

std::vector<int> CentroidClusterer::predict(const FeatureMatrix& matrix) const {
    if (!is_fitted())
        throw ConfigurationError("model", "predict called before fit");
    if (matrix.dim() != model_.dim)
        throw ConfigurationError("dim", "model has " + std::to_string(model_.dim) +
                                        " dimensions, matrix has " +
                                        std::to_string(matrix.dim()));

    std::vector<int> labels(matrix.rows());
    assign_labels(matrix.data(), matrix.rows(), model_.dim,
                  model_.centroids.data(), model_.k, labels.data());
    return labels;
}

void CentroidClusterer::load_model(KMeansModel model) {
    if (model.k < 1 || model.dim == 0 ||
        model.centroids.size() != static_cast<size_t>(model.k) * model.dim)
        throw ConfigurationError("model", "centroid block does not match k x dim");
    model_ = std::move(model);
}

}  // namespace aidcluster
