#ifndef AIDCLUSTER_TABLE_WRITER_HPP
#define AIDCLUSTER_TABLE_WRITER_HPP

#include "evaluator.hpp"
#include "ranker.hpp"
#include "types.hpp"

#include <fstream>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace aidcluster {

// Minimal CSV writer. Fields containing a comma, quote or newline are
// quoted; doubles are written with 17 significant digits, NaN as empty.
class CsvWriter {
public:
    // Throws std::runtime_error when the file cannot be opened.
    explicit CsvWriter(const std::string& path);

    void write_header(const std::vector<std::string>& cols) { write_fields(cols); }

    template <typename... Args>
    void write_row(Args&&... args) {
        std::vector<std::string> fields;
        fields.reserve(sizeof...(Args));
        (fields.push_back(field(std::forward<Args>(args))), ...);
        write_fields(fields);
    }

    void write_fields(const std::vector<std::string>& fields);

    // Throws std::runtime_error if any write failed.
    void close();

private:
    static std::string field(const std::string& s) { return s; }
    static std::string field(const char* s) { return s; }
    static std::string field(double v);
    static std::string field(int v) { return std::to_string(v); }
    static std::string field(size_t v) { return std::to_string(v); }

    std::string path_;
    std::ofstream out_;
};

// id,algorithm,cluster_id
void write_assignment_csv(const std::string& path, const ClusterAssignment& assignment);

// cluster_id,count,mean_<f>...,std_<f>...
void write_profiles_csv(const std::string& path,
                        const std::map<int, ClusterProfile>& profiles,
                        const std::vector<std::string>& feature_names);

// rank,id,cluster_id,score,cluster_score,tier
void write_priorities_csv(const std::string& path, const std::vector<PriorityEntry>& entries);

std::string profiles_to_json(const std::map<int, ClusterProfile>& profiles,
                             const std::vector<std::string>& feature_names,
                             bool pretty = true);

std::string priorities_to_json(const std::vector<PriorityEntry>& entries,
                               const std::vector<ClusterPriority>& clusters = {},
                               bool pretty = true);

std::string escape_json(const std::string& str);

}  // namespace aidcluster

#endif  // AIDCLUSTER_TABLE_WRITER_HPP
