#include "aidcluster/hierarchical.hpp"
#include "aidcluster/log.hpp"
#include "aidcluster/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>
#include <utility>

namespace aidcluster {

namespace {

int find_root(std::vector<int>& parent, int idx) {
    while (parent[static_cast<size_t>(idx)] != idx) {
        int up = parent[static_cast<size_t>(idx)];
        parent[static_cast<size_t>(idx)] = parent[static_cast<size_t>(up)];  // path halving
        idx = up;
    }
    return idx;
}

}  // namespace

MergeTree HierarchicalClusterer::build_tree(const FeatureMatrix& matrix) const {
    const size_t n = matrix.rows();
    const size_t dim = matrix.dim();
    const double* data = matrix.data();

    MergeTree tree;
    tree.leaf_ids = matrix.ids();
    if (n < 2) return tree;
    tree.merges.reserve(n - 1);

    // Ward "squared distance" between clusters; starts as ||x - y||^2.
    std::vector<double> d2(n * n, 0.0);
    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i)
        for (size_t j = 0; j < n; ++j)
            d2[i * n + j] = squared_l2(data + i * dim, data + j * dim, dim);

    std::vector<char> active(n, 1);
    std::vector<int> node(n);
    std::vector<double> size(n, 1.0);
    for (size_t i = 0; i < n; ++i) node[i] = static_cast<int>(i);

    for (size_t step = 0; step + 1 < n; ++step) {
        size_t bi = n, bj = n;
        double best = std::numeric_limits<double>::infinity();
        std::pair<int, int> best_pair{0, 0};

        for (size_t i = 0; i < n; ++i) {
            if (!active[i]) continue;
            for (size_t j = i + 1; j < n; ++j) {
                if (!active[j]) continue;
                double d = d2[i * n + j];
                std::pair<int, int> pair{std::min(node[i], node[j]), std::max(node[i], node[j])};
                if (bi == n || d < best || (d == best && pair < best_pair)) {
                    best = d;
                    best_pair = pair;
                    bi = i;
                    bj = j;
                }
            }
        }

        const double si = size[bi], sj = size[bj];
        for (size_t k = 0; k < n; ++k) {
            if (!active[k] || k == bi || k == bj) continue;
            const double sk = size[k];
            double v = ((si + sk) * d2[bi * n + k] + (sj + sk) * d2[bj * n + k] - sk * best) /
                       (si + sj + sk);
            if (v < 0.0) v = 0.0;
            d2[bi * n + k] = v;
            d2[k * n + bi] = v;
        }

        Merge m;
        m.left = best_pair.first;
        m.right = best_pair.second;
        m.height = std::sqrt(std::max(best, 0.0));
        m.size = static_cast<int>(si + sj);
        tree.merges.push_back(m);

        active[bj] = 0;
        node[bi] = static_cast<int>(n + step);
        size[bi] = si + sj;
    }

    AC_LOG_INFO("hierarchical", "built ward tree over %zu records, root height %.6g",
                n, tree.merges.back().height);
    return tree;
}

ClusterAssignment HierarchicalClusterer::cut(const MergeTree& tree, int k) {
    const size_t n = tree.n_leaves();
    if (k < 1)
        throw ConfigurationError("k", "must be >= 1, got " + std::to_string(k));
    if (static_cast<size_t>(k) > n)
        throw ConfigurationError("k", "k=" + std::to_string(k) +
                                      " exceeds record count " + std::to_string(n));
    if (tree.merges.size() + 1 != n)
        throw ConfigurationError("tree", "expected " + std::to_string(n - 1) +
                                         " merges, got " + std::to_string(tree.merges.size()));

    std::vector<int> parent(2 * n - 1);
    for (size_t i = 0; i < parent.size(); ++i) parent[i] = static_cast<int>(i);

    const size_t applied = n - static_cast<size_t>(k);
    for (size_t s = 0; s < applied; ++s) {
        const Merge& m = tree.merges[s];
        const int created = static_cast<int>(n + s);
        if (m.left < 0 || m.right < 0 || m.left >= created || m.right >= created)
            throw ConfigurationError("tree", "merge " + std::to_string(s) +
                                             " references an unknown node");
        parent[static_cast<size_t>(find_root(parent, m.left))] = created;
        parent[static_cast<size_t>(find_root(parent, m.right))] = created;
    }

    ClusterAssignment out;
    out.algorithm = "hierarchical";
    out.ids = tree.leaf_ids;
    out.labels.resize(n);

    std::unordered_map<int, int> root_to_label;
    int next_label = 0;
    for (size_t i = 0; i < n; ++i) {
        int root = find_root(parent, static_cast<int>(i));
        auto it = root_to_label.find(root);
        if (it == root_to_label.end())
            it = root_to_label.emplace(root, next_label++).first;
        out.labels[i] = it->second;
    }
    out.n_clusters = next_label;
    return out;
}

ClusterAssignment HierarchicalClusterer::fit(const FeatureMatrix& matrix,
                                             const ClusterParams& params) {
    int k = params.linkage_cut_k;
    if (k < 1 || static_cast<size_t>(k) > matrix.rows())
        throw ConfigurationError("linkage_cut_k", "must be in [1, " +
                                                  std::to_string(matrix.rows()) + "], got " +
                                                  std::to_string(k));
    tree_ = build_tree(matrix);
    return cut(tree_, k);
}

}  // namespace aidcluster
