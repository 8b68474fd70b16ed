#pragma once

#include "dockeval/grading/distribution.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dockeval {

// Cache goal: classify each reference column once per session.
// - Key = (scenario, metric name, grading knobs, column content), hashed
//   twice with FNV-1a so a changed database invalidates old entries.
// - Bounded memory via LRU eviction.
// - Owned by the caller and passed to grade() explicitly.

struct ReferenceCacheKey final {
    std::uint64_t h = 0;
    std::uint64_t h2 = 0;

    bool operator==(const ReferenceCacheKey& o) const noexcept { return h == o.h && h2 == o.h2; }
};

struct ReferenceCacheKeyHash final {
    std::size_t operator()(const ReferenceCacheKey& k) const noexcept {
        return static_cast<std::size_t>(k.h ^ (k.h2 + 0x9e3779b97f4a7c15ULL + (k.h << 6) + (k.h >> 2)));
    }
};

ReferenceCacheKey make_reference_key(const std::string& scenario, const ReferenceColumn& col,
                                     const GradingSettings& settings);

struct ReferenceCacheStats final {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t inserts = 0;
    std::uint64_t evictions = 0;
};

class ReferenceStatsCache final {
public:
    explicit ReferenceStatsCache(std::size_t max_entries = 4096);

    void clear();
    std::size_t size() const;
    ReferenceCacheStats stats() const;

    // Returns the cached classification or computes and stores it.
    std::shared_ptr<const ClassifiedMetric> get_or_classify(const std::string& scenario, const ReferenceColumn& col,
                                                            const GradingSettings& settings);

private:
    struct Node final {
        ReferenceCacheKey key{};
        std::shared_ptr<const ClassifiedMetric> value;
    };

    using List = std::list<Node>;

    mutable std::mutex mtx_;
    std::size_t max_entries_ = 4096;
    ReferenceCacheStats stats_{};
    List list_;
    std::unordered_map<ReferenceCacheKey, List::iterator, ReferenceCacheKeyHash> map_;
};

} // namespace dockeval
