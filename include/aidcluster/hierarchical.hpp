#ifndef AIDCLUSTER_HIERARCHICAL_HPP
#define AIDCLUSTER_HIERARCHICAL_HPP

#include "iclusterer.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace aidcluster {

// One agglomeration step. Node ids follow the linkage-matrix convention:
// leaves are 0..n-1, merge i creates node n + i. left < right.
struct Merge {
    int left;
    int right;
    double height;  // Ward distance sqrt(2 * increase in within-cluster SS)
    int size;       // leaves under the new node
};

// Merges are stored in the order they happened; that order is the unique
// ascending key used by cut().
struct MergeTree {
    std::vector<std::string> leaf_ids;
    std::vector<Merge> merges;  // leaf_ids.size() - 1 entries

    size_t n_leaves() const { return leaf_ids.size(); }
};

/**
 * Ward-linkage agglomerative clustering.
 * Each step merges the pair with the smallest Ward distance; exact ties go
 * to the ascending (lower node id, higher node id) pair.
 */
class HierarchicalClusterer : public IClusterer {
public:
    MergeTree build_tree(const FeatureMatrix& matrix) const;

    // Undo the last k - 1 merges. Labels are numbered by first appearance
    // in record order. Throws ConfigurationError unless 1 <= k <= n.
    static ClusterAssignment cut(const MergeTree& tree, int k);

    // cut(build_tree(matrix), params.linkage_cut_k); the tree is kept.
    ClusterAssignment fit(const FeatureMatrix& matrix,
                          const ClusterParams& params) override;

    const MergeTree& tree() const { return tree_; }
    std::string name() const override { return "hierarchical"; }

private:
    MergeTree tree_;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_HIERARCHICAL_HPP
