#include "aidcluster/data_generator.hpp"
#include "aidcluster/dbscan.hpp"
#include "aidcluster/hierarchical.hpp"
#include "aidcluster/kmeans.hpp"
#include "aidcluster/metrics.hpp"
#include "aidcluster/table_writer.hpp"

#include <sys/resource.h>

#include <chrono>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <utility>
#include <vector>

using namespace aidcluster;

static constexpr size_t DIM = 9;
static constexpr int NUM_GAUSSIANS = 4;
static constexpr unsigned DATA_SEED = 42;
static constexpr int K_MIN = 2;
static constexpr int K_MAX = 10;
static constexpr double DBSCAN_EPS = 1.5;
static constexpr int DBSCAN_MIN_SAMPLES = 3;

// Unbuffered progress log to stderr so output appears immediately
// even when stdout is piped or redirected.
static void log_progress(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::fprintf(stderr, "[BENCH] ");
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
    va_end(args);
}

// Wall time between consecutive laps, in milliseconds.
class StageClock {
public:
    StageClock() : last_(std::chrono::steady_clock::now()) {}

    double lap() {
        auto now = std::chrono::steady_clock::now();
        double ms = std::chrono::duration<double, std::milli>(now - last_).count();
        last_ = now;
        return ms;
    }

private:
    std::chrono::steady_clock::time_point last_;
};

// ru_maxrss is reported in kilobytes on Linux.
static double peak_rss_mb() {
    struct rusage ru;
    if (getrusage(RUSAGE_SELF, &ru) != 0) return NAN;
    return static_cast<double>(ru.ru_maxrss) / 1024.0;
}

// One timed stage: printed as a table row and kept for the optional CSV.
struct StageRow {
    size_t n;
    std::string stage;
    double ms;
    double metric;      // inertia, root height or noise count, per stage
    double silhouette;  // NaN where not computed
    double rss_mb;
};

static void print_table_header() {
    std::printf("%-8s | %-14s | %10s | %12s | %10s | %8s\n",
        "N", "Stage", "Time(ms)", "Metric", "Silhouette", "Mem(MB)");
    std::printf("%s\n", std::string(76, '-').c_str());
    std::fflush(stdout);
}

static void emit(std::vector<StageRow>& rows, StageRow row) {
    std::printf("%-8zu | %-14s | %10.1f | %12.4e | %10.4f | %8.1f\n",
        row.n, row.stage.c_str(), row.ms, row.metric, row.silhouette, row.rss_mb);
    std::fflush(stdout);
    rows.push_back(std::move(row));
}

int main() {
    std::vector<size_t> sizes = {167, 1000, 4000};
    if (const char* env_n = std::getenv("AIDCLUSTER_BENCH_N"))
        sizes = {static_cast<size_t>(std::stoul(env_n))};

    const char* csv_path = std::getenv("AIDCLUSTER_BENCH_CSV");
    std::vector<StageRow> rows;

    print_table_header();
    try {
        for (size_t n : sizes) {
            log_progress("generating N=%zu dim=%zu gaussians=%d", n, DIM, NUM_GAUSSIANS);
            FeatureMatrix m = generate_gaussian_mixture(n, DIM, NUM_GAUSSIANS, DATA_SEED);
            StageClock clock;

            CentroidClusterer km;
            KSearchResult search;
            ClusterAssignment fitted = km.fit_best(m, K_MIN, K_MAX, &search);
            double fit_ms = clock.lap();
            const int best = *search.best_k;
            const KScore& s = search.scores[static_cast<size_t>(best - K_MIN)];
            emit(rows, {n, "kmeans.search", fit_ms, s.inertia, s.silhouette, peak_rss_mb()});

            std::vector<int> truth = generate_ground_truth_labels(n, NUM_GAUSSIANS);
            log_progress("k=%d ARI vs generator=%.4f", best,
                         adjusted_rand_index(fitted.labels.data(), truth.data(), n));

            clock.lap();
            km.fit(m, best);
            emit(rows, {n, "kmeans.fit", clock.lap(), km.model().inertia, NAN, peak_rss_mb()});

            HierarchicalClusterer hc;
            MergeTree tree = hc.build_tree(m);
            emit(rows, {n, "ward.tree", clock.lap(), tree.merges.back().height, NAN,
                        peak_rss_mb()});

            DensityClusterer db;
            ClusterAssignment dense = db.fit(m, DBSCAN_EPS, DBSCAN_MIN_SAMPLES);
            emit(rows, {n, "dbscan.fit", clock.lap(),
                        static_cast<double>(dense.noise_count()), NAN, peak_rss_mb()});
        }

        if (csv_path) {
            CsvWriter csv(csv_path);
            csv.write_header({"n", "stage", "time_ms", "metric", "silhouette", "peak_rss_mb"});
            for (const auto& r : rows)
                csv.write_row(r.n, r.stage, r.ms, r.metric, r.silhouette, r.rss_mb);
            csv.close();
            log_progress("wrote %s", csv_path);
        }
    } catch (const std::exception& e) {
        log_progress("failed: %s", e.what());
        return 1;
    }
    return 0;
}
