#include "aidcluster/evaluator.hpp"
#include "aidcluster/log.hpp"
#include "aidcluster/metrics.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace aidcluster {

namespace {

using RowMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

void check_same_records(const ClusterAssignment& assignment, const FeatureMatrix& matrix) {
    if (assignment.size() != matrix.rows() || assignment.ids != matrix.ids())
        throw ConfigurationError("assignment",
                                 "does not describe the matrix records in matrix order (" +
                                 std::to_string(assignment.size()) + " labels, " +
                                 std::to_string(matrix.rows()) + " records)");
}

}  // namespace

Projection ClusterEvaluator::project(const FeatureMatrix& matrix, size_t dims) {
    const size_t n = matrix.rows();
    const size_t dim = matrix.dim();
    if (dims < 1 || dims > dim)
        throw ConfigurationError("projection_dims", "must be in [1, " + std::to_string(dim) +
                                                    "], got " + std::to_string(dims));

    Eigen::Map<const RowMatrix> x(matrix.data(), static_cast<Eigen::Index>(n),
                                  static_cast<Eigen::Index>(dim));
    const Eigen::RowVectorXd mu = x.colwise().mean();
    const Eigen::MatrixXd centered = x.rowwise() - mu;
    const double denom = n > 1 ? static_cast<double>(n - 1) : 1.0;
    const Eigen::MatrixXd cov = (centered.transpose() * centered) / denom;

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov);
    if (solver.info() != Eigen::Success)
        throw std::runtime_error("ClusterEvaluator::project: eigendecomposition failed");

    // Eigen returns ascending eigenvalues; walk them from the top.
    const Eigen::VectorXd& values = solver.eigenvalues();
    const Eigen::MatrixXd& vectors = solver.eigenvectors();
    double total = 0.0;
    for (Eigen::Index i = 0; i < values.size(); ++i) total += std::max(values(i), 0.0);

    Projection out;
    out.n = n;
    out.dims = dims;
    out.components.resize(dims * dim);
    out.explained_variance.resize(dims);
    out.explained_variance_ratio.resize(dims);

    Eigen::MatrixXd basis(static_cast<Eigen::Index>(dim), static_cast<Eigen::Index>(dims));
    for (size_t c = 0; c < dims; ++c) {
        const Eigen::Index src = static_cast<Eigen::Index>(dim - 1 - c);
        Eigen::VectorXd v = vectors.col(src);

        Eigen::Index pivot = 0;
        for (Eigen::Index j = 1; j < v.size(); ++j)
            if (std::abs(v(j)) > std::abs(v(pivot))) pivot = j;
        if (v(pivot) < 0.0) v = -v;

        basis.col(static_cast<Eigen::Index>(c)) = v;
        for (size_t j = 0; j < dim; ++j)
            out.components[c * dim + j] = v(static_cast<Eigen::Index>(j));

        const double ev = std::max(values(src), 0.0);
        out.explained_variance[c] = ev;
        out.explained_variance_ratio[c] = total > 0.0 ? ev / total : 0.0;
    }

    const Eigen::MatrixXd coords = centered * basis;
    out.coordinates.resize(n * dims);
    for (size_t i = 0; i < n; ++i)
        for (size_t c = 0; c < dims; ++c)
            out.coordinates[i * dims + c] =
                coords(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(c));

    AC_LOG_DEBUG("evaluator", "projected %zu records onto %zu components, ratio[0]=%.4f",
                 n, dims, out.explained_variance_ratio[0]);
    return out;
}

std::map<int, ClusterProfile> ClusterEvaluator::profile(const ClusterAssignment& assignment,
                                                        const FeatureMatrix& matrix) {
    check_same_records(assignment, matrix);
    const size_t dim = matrix.dim();

    std::map<int, ClusterProfile> out;
    for (size_t i = 0; i < matrix.rows(); ++i) {
        int label = assignment.labels[i];
        auto it = out.find(label);
        if (it == out.end()) {
            ClusterProfile p;
            p.cluster_id = label;
            p.mean.assign(dim, 0.0);
            p.stddev.assign(dim, 0.0);
            it = out.emplace(label, std::move(p)).first;
        }
        ClusterProfile& p = it->second;
        ++p.count;
        p.members.push_back(matrix.id(i));
        const double* x = matrix.row(i);
        for (size_t j = 0; j < dim; ++j) p.mean[j] += x[j];
    }
    for (auto& kv : out) {
        ClusterProfile& p = kv.second;
        for (size_t j = 0; j < dim; ++j) p.mean[j] /= static_cast<double>(p.count);
    }

    // Second pass in record order keeps the variance sums reproducible.
    for (size_t i = 0; i < matrix.rows(); ++i) {
        ClusterProfile& p = out[assignment.labels[i]];
        const double* x = matrix.row(i);
        for (size_t j = 0; j < dim; ++j) {
            double d = x[j] - p.mean[j];
            p.stddev[j] += d * d;
        }
    }
    for (auto& kv : out) {
        ClusterProfile& p = kv.second;
        for (size_t j = 0; j < dim; ++j)
            p.stddev[j] = std::sqrt(p.stddev[j] / static_cast<double>(p.count));
    }
    return out;
}

double ClusterEvaluator::agreement(const ClusterAssignment& a, const ClusterAssignment& b) {
    if (a.size() != b.size())
        throw ConfigurationError("assignment", "cannot compare " + std::to_string(a.size()) +
                                               " labels with " + std::to_string(b.size()));
    if (a.ids != b.ids)
        throw ConfigurationError("assignment", "assignments cover different records");
    return adjusted_rand_index(a.labels.data(), b.labels.data(), a.size());
}

ConsistencyReport ClusterEvaluator::check_consistency(const ClusterAssignment& a,
                                                      const ClusterAssignment& b,
                                                      double threshold) {
    if (!std::isfinite(threshold) || threshold < -1.0 || threshold > 1.0)
        throw ConfigurationError("agreement_threshold", "must be in [-1, 1]");

    ConsistencyReport report;
    report.score = agreement(a, b);
    report.threshold = threshold;
    report.consistent = report.score >= threshold;
    if (!report.consistent)
        AC_LOG_WARN("evaluator", "%s vs %s agreement %.4f below threshold %.4f",
                    a.algorithm.c_str(), b.algorithm.c_str(), report.score, threshold);
    else
        AC_LOG_INFO("evaluator", "%s vs %s agreement %.4f",
                    a.algorithm.c_str(), b.algorithm.c_str(), report.score);
    return report;
}

double ClusterEvaluator::silhouette(const ClusterAssignment& assignment,
                                   const FeatureMatrix& matrix) {
    check_same_records(assignment, matrix);
    std::vector<double> dist = pairwise_distances(matrix.data(), matrix.rows(), matrix.dim());
    return silhouette_score(dist.data(), assignment.labels.data(), matrix.rows());
}

}  // namespace aidcluster
