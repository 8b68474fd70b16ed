#include "dockeval/grading/reference_cache.hpp"

#include "dockeval/core/hashing.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace dockeval {

namespace {

constexpr std::uint64_t kSecondarySeed = 0x84222325cbf29ce4ULL;

void hash_into(Fnv1a64& f, const std::string& scenario, const ReferenceColumn& col, const GradingSettings& s) {
    f.update_string(scenario);
    f.update_string(col.name);
    f.update_bool(col.integral);
    f.update_bool(col.has_nulls);
    f.update_f64(s.alpha);
    f.update_f64(s.outlier_sigma);
    f.update_u64(static_cast<std::uint64_t>(s.max_quantiles));
    f.update_f64_vec(col.values);
}

} // namespace

ReferenceCacheKey make_reference_key(const std::string& scenario, const ReferenceColumn& col,
                                     const GradingSettings& settings) {
    Fnv1a64 a;
    Fnv1a64 b(kSecondarySeed);
    hash_into(a, scenario, col, settings);
    hash_into(b, scenario, col, settings);
    return ReferenceCacheKey{a.value(), b.value()};
}

ReferenceStatsCache::ReferenceStatsCache(std::size_t max_entries) : max_entries_(std::max<std::size_t>(1, max_entries)) {}

void ReferenceStatsCache::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    list_.clear();
    map_.clear();
    stats_ = ReferenceCacheStats{};
}

std::size_t ReferenceStatsCache::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return list_.size();
}

ReferenceCacheStats ReferenceStatsCache::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
}

std::shared_ptr<const ClassifiedMetric> ReferenceStatsCache::get_or_classify(const std::string& scenario,
                                                                             const ReferenceColumn& col,
                                                                             const GradingSettings& settings) {
    const ReferenceCacheKey key = make_reference_key(scenario, col, settings);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            list_.splice(list_.begin(), list_, it->second);
            ++stats_.hits;
            return it->second->value;
        }
        ++stats_.misses;
    }

    // Classification runs unlocked; a concurrent insert of the same key just
    // refreshes the entry.
    auto value = std::make_shared<const ClassifiedMetric>(classify_and_prepare(col, settings));

    std::lock_guard<std::mutex> lk(mtx_);
    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second->value = value;
        list_.splice(list_.begin(), list_, it->second);
        return value;
    }
    list_.push_front(Node{key, value});
    map_[key] = list_.begin();
    ++stats_.inserts;
    while (list_.size() > max_entries_) {
        auto last_it = std::prev(list_.end());
        map_.erase(last_it->key);
        list_.pop_back();
        ++stats_.evictions;
    }
    return value;
}

} // namespace dockeval
