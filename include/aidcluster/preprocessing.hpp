#ifndef AIDCLUSTER_PREPROCESSING_HPP
#define AIDCLUSTER_PREPROCESSING_HPP

#include "types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace aidcluster {

struct Record {
    std::string id;
    std::vector<double> values;  // one per RawTable column
};

// Raw indicator table. validate() throws DataShapeError on an empty table,
// ragged records, duplicate ids or non-finite values.
struct RawTable {
    std::vector<std::string> columns;
    std::vector<Record> records;

    size_t rows() const { return records.size(); }
    int column_index(const std::string& name) const;
    void validate() const;
};

// Per-column z-score parameters fitted on a table.
struct Scaler {
    std::vector<std::string> columns;
    std::vector<double> mean;
    std::vector<double> scale;  // population std, 1 for constant columns

    FeatureMatrix transform(const RawTable& table) const;
};

// Standardise the selected columns (all columns when empty). The fitted
// parameters are written to *scaler when it is non-null.
FeatureMatrix standardize(const RawTable& table,
                          const std::vector<std::string>& selected = {},
                          Scaler* scaler = nullptr);

// Clip each named column to [Q1 - m*IQR, Q3 + m*IQR], quartiles by linear
// interpolation between order statistics.
RawTable winsorize_iqr(const RawTable& table,
                       const std::vector<std::string>& columns,
                       double multiplier = 1.5);

RawTable add_ratio_feature(const RawTable& table,
                           const std::string& numerator,
                           const std::string& denominator,
                           const std::string& name);

// 1.0 where the source value is strictly above the column median.
RawTable add_threshold_flag(const RawTable& table,
                            const std::string& source,
                            const std::string& name);

// Linear-interpolated quantile of unsorted values, q in [0, 1].
double quantile(std::vector<double> values, double q);

}  // namespace aidcluster

#endif  // AIDCLUSTER_PREPROCESSING_HPP
