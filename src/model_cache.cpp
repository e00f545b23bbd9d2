#include "aidcluster/model_cache.hpp"
#include "aidcluster/log.hpp"

#include <cinttypes>
#include <cstdio>
#include <mutex>
#include <utility>

#define XXH_INLINE_ALL
#include <xxhash.h>

namespace aidcluster {

namespace {

void append_sized(std::string& buf, const std::string& s) {
    uint64_t len = s.size();
    buf.append(reinterpret_cast<const char*>(&len), sizeof(len));
    buf.append(s);
}

}  // namespace

// ---------------------------------------------------------------------------
// fingerprint / keys
// ---------------------------------------------------------------------------

uint64_t fingerprint(const FeatureMatrix& matrix) {
    std::string buf;
    for (const auto& id : matrix.ids()) append_sized(buf, id);
    for (const auto& name : matrix.feature_names()) append_sized(buf, name);
    buf.append(reinterpret_cast<const char*>(matrix.data()),
               matrix.rows() * matrix.dim() * sizeof(double));
    return static_cast<uint64_t>(XXH3_64bits(buf.data(), buf.size()));
}

std::string canonical_params(const ClusterParams& params, const TrainConfig& train) {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "k=%d;k_min=%d;k_max=%d;cut=%d;eps=%.17g;min_samples=%d;"
                  "max_iter=%zu;n_init=%d;seed=%u",
                  params.k, params.k_min, params.k_max, params.linkage_cut_k,
                  params.eps, params.min_samples,
                  train.max_iter, train.n_init, train.seed);
    return buf;
}

CacheKey make_key(const FeatureMatrix& matrix, const std::string& algorithm,
                  const ClusterParams& params, const TrainConfig& train) {
    CacheKey key;
    key.fingerprint = fingerprint(matrix);
    key.algorithm = algorithm;
    key.params = canonical_params(params, train);
    return key;
}

// ---------------------------------------------------------------------------
// ModelCache
// ---------------------------------------------------------------------------

template <typename Map>
typename Map::mapped_type ModelCache::lookup(const Map& map, const CacheKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = map.find(key);
    if (it == map.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second;
}

ModelCache::Entry ModelCache::get(const CacheKey& key) const {
    return lookup(entries_, key);
}

ModelCache::SearchEntry ModelCache::get_search(const CacheKey& key) const {
    return lookup(searches_, key);
}

void ModelCache::put(const CacheKey& key, ClusterAssignment assignment) {
    auto entry = std::make_shared<const ClusterAssignment>(std::move(assignment));
    std::unique_lock<std::shared_mutex> lock(mu_);
    entries_[key] = std::move(entry);
}

void ModelCache::put_search(const CacheKey& key, KSearchResult search) {
    auto entry = std::make_shared<const KSearchResult>(std::move(search));
    std::unique_lock<std::shared_mutex> lock(mu_);
    searches_[key] = std::move(entry);
}

bool ModelCache::invalidate(const CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    size_t dropped = entries_.erase(key) + searches_.erase(key);
    return dropped > 0;
}

namespace {

template <typename Map>
size_t erase_matrix(Map& map, uint64_t fp) {
    size_t dropped = 0;
    for (auto it = map.begin(); it != map.end();) {
        if (it->first.fingerprint == fp) {
            it = map.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

}  // namespace

size_t ModelCache::invalidate_matrix(uint64_t fp) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    size_t dropped = erase_matrix(entries_, fp) + erase_matrix(searches_, fp);
    AC_LOG_DEBUG("cache", "invalidated %zu entries for matrix %016" PRIx64, dropped, fp);
    return dropped;
}

void ModelCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mu_);
    entries_.clear();
    searches_.clear();
}

size_t ModelCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return entries_.size();
}

size_t ModelCache::search_count() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return searches_.size();
}

}  // namespace aidcluster
