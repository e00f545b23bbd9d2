#include "aidcluster/types.hpp"

#include <cmath>
#include <unordered_set>
#include <utility>

namespace aidcluster {

FeatureMatrix::FeatureMatrix(std::vector<std::string> ids,
                             std::vector<std::string> feature_names,
                             std::vector<double> values)
    : ids_(std::move(ids)),
      feature_names_(std::move(feature_names)),
      values_(std::move(values)) {
    if (ids_.empty())
        throw DataShapeError("feature matrix has zero records");
    if (feature_names_.empty())
        throw DataShapeError("feature matrix has zero dimensions");
    if (values_.size() != ids_.size() * feature_names_.size())
        throw DataShapeError("expected " + std::to_string(ids_.size()) + " x " +
                             std::to_string(feature_names_.size()) + " values, got " +
                             std::to_string(values_.size()));

    std::unordered_set<std::string> seen;
    seen.reserve(ids_.size());
    for (const auto& id : ids_) {
        if (!seen.insert(id).second)
            throw DataShapeError("duplicate record id '" + id + "'");
    }

    const size_t d = feature_names_.size();
    for (size_t i = 0; i < values_.size(); ++i) {
        if (!std::isfinite(values_[i]))
            throw DataShapeError("non-finite value for record '" + ids_[i / d] +
                                 "', feature '" + feature_names_[i % d] + "'");
    }
}

FeatureMatrix FeatureMatrix::from_rows(std::vector<std::string> ids,
                                       std::vector<std::string> feature_names,
                                       const std::vector<std::vector<double>>& rows) {
    if (rows.size() != ids.size())
        throw DataShapeError("got " + std::to_string(rows.size()) + " rows for " +
                             std::to_string(ids.size()) + " ids");

    const size_t d = feature_names.size();
    std::vector<double> values;
    values.reserve(rows.size() * d);
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != d)
            throw DataShapeError("record '" + ids[i] + "' has " +
                                 std::to_string(rows[i].size()) + " values, expected " +
                                 std::to_string(d));
        values.insert(values.end(), rows[i].begin(), rows[i].end());
    }
    return FeatureMatrix(std::move(ids), std::move(feature_names), std::move(values));
}

int FeatureMatrix::feature_index(const std::string& name) const {
    for (size_t j = 0; j < feature_names_.size(); ++j)
        if (feature_names_[j] == name) return static_cast<int>(j);
    return -1;
}

int ClusterAssignment::label_of(const std::string& id) const {
    for (size_t i = 0; i < ids.size(); ++i)
        if (ids[i] == id) return labels[i];
    throw ConfigurationError("id", "unknown record '" + id + "'");
}

size_t ClusterAssignment::noise_count() const {
    size_t cnt = 0;
    for (int l : labels)
        if (l == kNoiseLabel) ++cnt;
    return cnt;
}

std::vector<size_t> ClusterAssignment::cluster_sizes() const {
    std::vector<size_t> sizes(static_cast<size_t>(n_clusters > 0 ? n_clusters : 0), 0);
    for (int l : labels)
        if (l >= 0 && l < n_clusters) sizes[static_cast<size_t>(l)]++;
    return sizes;
}

}  // namespace aidcluster
