#include "aidcluster/table_writer.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace aidcluster {

namespace {

std::string format_double(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

std::string json_number(double v) {
    return std::isfinite(v) ? format_double(v) : "null";
}

std::string indent(int level, bool pretty) {
    return pretty ? std::string(static_cast<size_t>(level) * 2, ' ') : std::string();
}

void write_double_array(std::ostringstream& ss, const std::vector<double>& values) {
    ss << '[';
    for (size_t j = 0; j < values.size(); ++j) {
        if (j > 0) ss << ", ";
        ss << json_number(values[j]);
    }
    ss << ']';
}

}  // namespace

// ---------------------------------------------------------------------------
// CsvWriter
// ---------------------------------------------------------------------------

CsvWriter::CsvWriter(const std::string& path) : path_(path), out_(path) {
    if (!out_.is_open())
        throw std::runtime_error("CsvWriter: cannot open " + path);
}

std::string CsvWriter::field(double v) {
    return std::isnan(v) ? std::string() : format_double(v);
}

void CsvWriter::write_fields(const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out_ << ',';
        const std::string& f = fields[i];
        if (f.find_first_of(",\"\n\r") == std::string::npos) {
            out_ << f;
            continue;
        }
        out_ << '"';
        for (char c : f) {
            if (c == '"') out_ << '"';
            out_ << c;
        }
        out_ << '"';
    }
    out_ << '\n';
}

void CsvWriter::close() {
    out_.close();
    if (out_.fail())
        throw std::runtime_error("CsvWriter: write to " + path_ + " failed");
}

void write_assignment_csv(const std::string& path, const ClusterAssignment& assignment) {
    CsvWriter csv(path);
    csv.write_header({"id", "algorithm", "cluster_id"});
    for (size_t i = 0; i < assignment.size(); ++i)
        csv.write_row(assignment.ids[i], assignment.algorithm, assignment.labels[i]);
    csv.close();
}

void write_profiles_csv(const std::string& path,
                        const std::map<int, ClusterProfile>& profiles,
                        const std::vector<std::string>& feature_names) {
    std::vector<std::string> header = {"cluster_id", "count"};
    for (const auto& f : feature_names) header.push_back("mean_" + f);
    for (const auto& f : feature_names) header.push_back("std_" + f);

    CsvWriter csv(path);
    csv.write_header(header);
    for (const auto& kv : profiles) {
        const ClusterProfile& p = kv.second;
        if (p.mean.size() != feature_names.size() || p.stddev.size() != feature_names.size())
            throw ConfigurationError("profiles", "profile for cluster " +
                                                 std::to_string(p.cluster_id) +
                                                 " does not match the feature list");
        std::vector<std::string> row = {std::to_string(p.cluster_id), std::to_string(p.count)};
        for (double m : p.mean) row.push_back(format_double(m));
        for (double s : p.stddev) row.push_back(format_double(s));
        csv.write_fields(row);
    }
    csv.close();
}

void write_priorities_csv(const std::string& path, const std::vector<PriorityEntry>& entries) {
    CsvWriter csv(path);
    csv.write_header({"rank", "id", "cluster_id", "score", "cluster_score", "tier"});
    for (const auto& e : entries)
        csv.write_row(e.rank, e.id, e.cluster_id, e.score, e.cluster_score, tier_name(e.tier));
    csv.close();
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

std::string escape_json(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
        case '"':  result += "\\\""; break;
        case '\\': result += "\\\\"; break;
        case '\n': result += "\\n"; break;
        case '\r': result += "\\r"; break;
        case '\t': result += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                result += buf;
            } else {
                result += c;
            }
            break;
        }
    }
    return result;
}

std::string profiles_to_json(const std::map<int, ClusterProfile>& profiles,
                             const std::vector<std::string>& feature_names,
                             bool pretty) {
    const std::string nl = pretty ? "\n" : "";
    auto ind = [pretty](int level) { return indent(level, pretty); };

    std::ostringstream ss;
    ss << '{' << nl;
    ss << ind(1) << "\"features\": [";
    for (size_t j = 0; j < feature_names.size(); ++j) {
        if (j > 0) ss << ", ";
        ss << '"' << escape_json(feature_names[j]) << '"';
    }
    ss << "]," << nl;

    ss << ind(1) << "\"clusters\": [" << nl;
    size_t i = 0;
    for (const auto& kv : profiles) {
        const ClusterProfile& p = kv.second;
        ss << ind(2) << '{' << nl;
        ss << ind(3) << "\"cluster_id\": " << p.cluster_id << ',' << nl;
        ss << ind(3) << "\"count\": " << p.count << ',' << nl;
        ss << ind(3) << "\"mean\": ";
        write_double_array(ss, p.mean);
        ss << ',' << nl;
        ss << ind(3) << "\"stddev\": ";
        write_double_array(ss, p.stddev);
        ss << ',' << nl;
        ss << ind(3) << "\"members\": [";
        for (size_t m = 0; m < p.members.size(); ++m) {
            if (m > 0) ss << ", ";
            ss << '"' << escape_json(p.members[m]) << '"';
        }
        ss << ']' << nl;
        ss << ind(2) << '}' << (++i < profiles.size() ? "," : "") << nl;
    }
    ss << ind(1) << ']' << nl;
    ss << '}' << nl;
    return ss.str();
}

std::string priorities_to_json(const std::vector<PriorityEntry>& entries,
                               const std::vector<ClusterPriority>& clusters,
                               bool pretty) {
    const std::string nl = pretty ? "\n" : "";
    auto ind = [pretty](int level) { return indent(level, pretty); };

    std::ostringstream ss;
    ss << '{' << nl;
    ss << ind(1) << "\"records\": [" << nl;
    for (size_t i = 0; i < entries.size(); ++i) {
        const PriorityEntry& e = entries[i];
        ss << ind(2) << "{\"rank\": " << e.rank
           << ", \"id\": \"" << escape_json(e.id) << '"'
           << ", \"cluster_id\": " << e.cluster_id
           << ", \"score\": " << json_number(e.score)
           << ", \"cluster_score\": " << json_number(e.cluster_score)
           << ", \"tier\": \"" << tier_name(e.tier) << "\"}"
           << (i + 1 < entries.size() ? "," : "") << nl;
    }
    ss << ind(1) << "]," << nl;

    ss << ind(1) << "\"clusters\": [" << nl;
    for (size_t i = 0; i < clusters.size(); ++i) {
        const ClusterPriority& c = clusters[i];
        ss << ind(2) << "{\"rank\": " << c.rank
           << ", \"cluster_id\": " << c.cluster_id
           << ", \"size\": " << c.size
           << ", \"score\": " << json_number(c.score)
           << ", \"tier\": \"" << tier_name(c.tier) << "\"}"
           << (i + 1 < clusters.size() ? "," : "") << nl;
    }
    ss << ind(1) << ']' << nl;
    ss << '}' << nl;
    return ss.str();
}

}  // namespace aidcluster
