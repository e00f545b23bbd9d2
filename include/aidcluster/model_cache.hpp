#ifndef AIDCLUSTER_MODEL_CACHE_HPP
#define AIDCLUSTER_MODEL_CACHE_HPP

#include "iclusterer.hpp"
#include "kmeans.hpp"
#include "types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <tuple>

namespace aidcluster {

// XXH3 64-bit over ids, feature names and raw value bits.
uint64_t fingerprint(const FeatureMatrix& matrix);

// Every field that can change a fit, printed at full precision.
std::string canonical_params(const ClusterParams& params, const TrainConfig& train);

struct CacheKey {
    uint64_t fingerprint = 0;
    std::string algorithm;
    std::string params;

    bool operator<(const CacheKey& o) const {
        return std::tie(fingerprint, algorithm, params) <
               std::tie(o.fingerprint, o.algorithm, o.params);
    }
    bool operator==(const CacheKey& o) const {
        return fingerprint == o.fingerprint && algorithm == o.algorithm && params == o.params;
    }
};

CacheKey make_key(const FeatureMatrix& matrix, const std::string& algorithm,
                  const ClusterParams& params, const TrainConfig& train = {});

/**
 * Explicit, injectable store of fitted assignments and k-search results.
 * Entries are shared and immutable; readers take a shared lock.
 * One instance may be shared by several pipelines.
 */
class ModelCache {
public:
    using Entry = std::shared_ptr<const ClusterAssignment>;
    using SearchEntry = std::shared_ptr<const KSearchResult>;

    // Null on miss.
    Entry get(const CacheKey& key) const;
    SearchEntry get_search(const CacheKey& key) const;

    // Replaces any existing entry for the key.
    void put(const CacheKey& key, ClusterAssignment assignment);
    void put_search(const CacheKey& key, KSearchResult search);

    // Drops the assignment and the search stored under the key.
    bool invalidate(const CacheKey& key);

    // Drops every entry fitted on the given matrix; returns the count.
    size_t invalidate_matrix(uint64_t fingerprint);

    void clear();

    // Stored assignments / stored searches.
    size_t size() const;
    size_t search_count() const;

    // Lookups of either kind.
    uint64_t hits() const { return hits_.load(std::memory_order_relaxed); }
    uint64_t misses() const { return misses_.load(std::memory_order_relaxed); }

private:
    template <typename Map>
    typename Map::mapped_type lookup(const Map& map, const CacheKey& key) const;

    mutable std::shared_mutex mu_;  // protects entries_ and searches_
    std::map<CacheKey, Entry> entries_;
    std::map<CacheKey, SearchEntry> searches_;
    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_MODEL_CACHE_HPP
