#include "aidcluster/preprocessing.hpp"
#include "aidcluster/log.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace aidcluster {

namespace {

size_t require_column(const RawTable& table, const std::string& name) {
    int idx = table.column_index(name);
    if (idx < 0)
        throw ConfigurationError("columns", "unknown column '" + name + "'");
    return static_cast<size_t>(idx);
}

std::vector<double> column_values(const RawTable& table, size_t col) {
    std::vector<double> out;
    out.reserve(table.rows());
    for (const auto& r : table.records) out.push_back(r.values[col]);
    return out;
}

RawTable with_column(const RawTable& table, const std::string& name,
                     const std::vector<double>& values) {
    if (table.column_index(name) >= 0)
        throw ConfigurationError("columns", "column '" + name + "' already exists");
    RawTable out = table;
    out.columns.push_back(name);
    for (size_t i = 0; i < out.records.size(); ++i)
        out.records[i].values.push_back(values[i]);
    return out;
}

}  // namespace

int RawTable::column_index(const std::string& name) const {
    for (size_t j = 0; j < columns.size(); ++j)
        if (columns[j] == name) return static_cast<int>(j);
    return -1;
}

void RawTable::validate() const {
    if (records.empty())
        throw DataShapeError("table has zero records");
    if (columns.empty())
        throw DataShapeError("table has zero columns");

    std::unordered_set<std::string> seen;
    for (const auto& r : records) {
        if (!seen.insert(r.id).second)
            throw DataShapeError("duplicate record id '" + r.id + "'");
        if (r.values.size() != columns.size())
            throw DataShapeError("record '" + r.id + "' has " + std::to_string(r.values.size()) +
                                 " values, expected " + std::to_string(columns.size()));
        for (size_t j = 0; j < r.values.size(); ++j)
            if (!std::isfinite(r.values[j]))
                throw DataShapeError("non-finite value for record '" + r.id +
                                     "', column '" + columns[j] + "'");
    }
}

double quantile(std::vector<double> values, double q) {
    if (values.empty())
        throw DataShapeError("quantile of an empty column");
    if (!(q >= 0.0 && q <= 1.0))
        throw ConfigurationError("quantile", "q must be in [0, 1]");
    std::sort(values.begin(), values.end());
    double pos = q * static_cast<double>(values.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, values.size() - 1);
    double frac = pos - static_cast<double>(lo);
    return values[lo] + frac * (values[hi] - values[lo]);
}

FeatureMatrix Scaler::transform(const RawTable& table) const {
    if (mean.size() != columns.size() || scale.size() != columns.size())
        throw ConfigurationError("scaler", "mean/scale do not match the column list");
    table.validate();
    std::vector<size_t> cols;
    cols.reserve(columns.size());
    for (const auto& c : columns) cols.push_back(require_column(table, c));

    const size_t n = table.rows();
    const size_t d = cols.size();
    std::vector<std::string> ids;
    ids.reserve(n);
    std::vector<double> values(n * d);
    for (size_t i = 0; i < n; ++i) {
        const Record& r = table.records[i];
        ids.push_back(r.id);
        for (size_t j = 0; j < d; ++j)
            values[i * d + j] = (r.values[cols[j]] - mean[j]) / scale[j];
    }
    return FeatureMatrix(std::move(ids), columns, std::move(values));
}

FeatureMatrix standardize(const RawTable& table,
                          const std::vector<std::string>& selected,
                          Scaler* scaler) {
    table.validate();

    Scaler fitted;
    fitted.columns = selected.empty() ? table.columns : selected;
    const double n = static_cast<double>(table.rows());
    for (const auto& name : fitted.columns) {
        std::vector<double> col = column_values(table, require_column(table, name));
        double mu = 0.0;
        for (double v : col) mu += v;
        mu /= n;
        double ss = 0.0;
        for (double v : col) ss += (v - mu) * (v - mu);
        double sd = std::sqrt(ss / n);
        if (sd == 0.0) {
            AC_LOG_DEBUG("preprocess", "column %s is constant, scale 1", name.c_str());
            sd = 1.0;
        }
        fitted.mean.push_back(mu);
        fitted.scale.push_back(sd);
    }

    FeatureMatrix out = fitted.transform(table);
    if (scaler) *scaler = std::move(fitted);
    return out;
}

RawTable winsorize_iqr(const RawTable& table,
                       const std::vector<std::string>& columns,
                       double multiplier) {
    table.validate();
    if (!(multiplier >= 0.0) || !std::isfinite(multiplier))
        throw ConfigurationError("multiplier", "must be a non-negative finite value");

    RawTable out = table;
    for (const auto& name : columns) {
        size_t col = require_column(table, name);
        std::vector<double> vals = column_values(table, col);
        double q1 = quantile(vals, 0.25);
        double q3 = quantile(vals, 0.75);
        double iqr = q3 - q1;
        double lo = q1 - multiplier * iqr;
        double hi = q3 + multiplier * iqr;

        size_t clipped = 0;
        for (auto& r : out.records) {
            double v = r.values[col];
            double c = std::min(std::max(v, lo), hi);
            if (c != v) ++clipped;
            r.values[col] = c;
        }
        AC_LOG_DEBUG("preprocess", "winsorize %s to [%.4g, %.4g], %zu values clipped",
                     name.c_str(), lo, hi, clipped);
    }
    return out;
}

RawTable add_ratio_feature(const RawTable& table,
                           const std::string& numerator,
                           const std::string& denominator,
                           const std::string& name) {
    table.validate();
    size_t num = require_column(table, numerator);
    size_t den = require_column(table, denominator);

    std::vector<double> ratio;
    ratio.reserve(table.rows());
    for (const auto& r : table.records) {
        if (r.values[den] == 0.0)
            throw DataShapeError("record '" + r.id + "' has zero " + denominator);
        ratio.push_back(r.values[num] / r.values[den]);
    }
    return with_column(table, name, ratio);
}

RawTable add_threshold_flag(const RawTable& table,
                            const std::string& source,
                            const std::string& name) {
    table.validate();
    size_t col = require_column(table, source);
    double median = quantile(column_values(table, col), 0.5);

    std::vector<double> flag;
    flag.reserve(table.rows());
    for (const auto& r : table.records)
        flag.push_back(r.values[col] > median ? 1.0 : 0.0);
    return with_column(table, name, flag);
}

}  // namespace aidcluster
