#ifndef AIDCLUSTER_TYPES_HPP
#define AIDCLUSTER_TYPES_HPP

#include "errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace aidcluster {

// Reserved label for density-clustering noise; never a valid cluster id.
constexpr int kNoiseLabel = -1;

/**
 * Standardised feature vectors, one row per record.
 * Data is contiguous row-major double: data()[i * dim() + j] = record i, feature j.
 * Immutable after construction; the constructor enforces the shape invariants
 * and throws DataShapeError on violation.
 */
class FeatureMatrix {
public:
    FeatureMatrix(std::vector<std::string> ids,
                  std::vector<std::string> feature_names,
                  std::vector<double> values);

    // One inner vector per record; ragged rows are a DataShapeError.
    static FeatureMatrix from_rows(std::vector<std::string> ids,
                                   std::vector<std::string> feature_names,
                                   const std::vector<std::vector<double>>& rows);

    size_t rows() const { return ids_.size(); }
    size_t dim() const { return feature_names_.size(); }

    const double* data() const { return values_.data(); }
    const double* row(size_t i) const { return values_.data() + i * dim(); }
    double at(size_t i, size_t j) const { return values_[i * dim() + j]; }

    const std::string& id(size_t i) const { return ids_[i]; }
    const std::vector<std::string>& ids() const { return ids_; }
    const std::vector<std::string>& feature_names() const { return feature_names_; }

    // Column index of a named feature, or -1.
    int feature_index(const std::string& name) const;

private:
    std::vector<std::string> ids_;
    std::vector<std::string> feature_names_;
    std::vector<double> values_;
};

/**
 * Record id -> integer label, in matrix order. Produced once per fit call.
 * n_clusters counts valid ids 0..n_clusters-1 and excludes noise.
 */
struct ClusterAssignment {
    std::string algorithm;
    std::vector<std::string> ids;
    std::vector<int> labels;
    int n_clusters = 0;
    int iterations = 0;
    std::optional<ConvergenceWarning> warning;

    size_t size() const { return labels.size(); }
    bool converged() const { return !warning.has_value(); }

    // Label for a record id; throws ConfigurationError for unknown ids.
    int label_of(const std::string& id) const;

    size_t noise_count() const;
    std::vector<size_t> cluster_sizes() const;
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_TYPES_HPP
