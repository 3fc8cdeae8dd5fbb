#pragma once
#include "accessor/NodeAccessor.hpp"

#include <cstddef>
#include <list>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

namespace TP {

using Json    = nlohmann::ordered_json;
// Points at a node inside the accessor's tree and keeps the whole tree alive.
using NodeRef = std::shared_ptr<Json const>;

struct LookupCacheOptions {
    static constexpr std::size_t DefaultMaxSize = 128;

    bool                       enabled = true;
    std::optional<std::size_t> maxSize = DefaultMaxSize; // nullopt = unbounded
};

struct LookupCacheMetrics {
    std::size_t hits      = 0;
    std::size_t misses    = 0;
    std::size_t evictions = 0;
    std::size_t walks     = 0;
};

/**
 * Accessor over an in-memory JSON tree (objects, arrays, scalars).
 *
 * The tree is fixed for the lifetime of the accessor; to point at a different
 * tree construct a new accessor. resolve() memoizes the node reached by each
 * full segment sequence in a per-instance LRU cache. The cache is never
 * invalidated by the tree because the tree cannot change.
 *
 * Not thread-safe: resolve() mutates the cache.
 */
class LookupAccessor final : public NodeAccessor<NodeRef> {
public:
    explicit LookupAccessor(Json tree, LookupCacheOptions options = {});
    explicit LookupAccessor(std::shared_ptr<Json const> tree, LookupCacheOptions options = {});

    static auto create(Json tree, LookupCacheOptions options = {}) -> std::shared_ptr<LookupAccessor>;

    [[nodiscard]] auto root() const -> NodeRef const& { return this->tree; }

    auto stat(Segments parts) const -> std::optional<Stat> override;
    auto validate(Segments parts) const -> Expected<void> override;
    auto resolve(Segments parts) -> Expected<NodeRef> override;
    auto keys(Segments parts) const -> Expected<std::vector<Segment>> override;
    auto open(Segments parts) -> Expected<NodeRef> override;
    auto contains(Segments parts, Segment const& key) const -> bool override;
    auto length(Segments parts) const -> Expected<std::size_t> override;
    auto isTraversable(Segments parts) const -> bool override;

    auto clearCache() -> void;
    auto disableCache() -> void;
    auto enableCache(std::optional<std::size_t> maxSize = LookupCacheOptions::DefaultMaxSize) -> Expected<void>;

    [[nodiscard]] auto cacheEnabled() const -> bool { return this->enabled; }
    [[nodiscard]] auto cacheMaxSize() const -> std::optional<std::size_t> { return this->maxSize; }
    [[nodiscard]] auto cacheSize() const -> std::size_t { return this->entries.size(); }
    [[nodiscard]] auto isCached(Segments parts) const -> bool;
    [[nodiscard]] auto cacheMetrics() const -> LookupCacheMetrics { return this->metrics; }
    auto               resetCacheMetrics() -> void;

private:
    struct CacheEntry {
        std::vector<Segment> key;
        NodeRef              node;
    };
    using CacheList  = std::list<CacheEntry>;
    using CacheIndex = phmap::flat_hash_map<std::vector<Segment>, CacheList::iterator, SegmentsHash, SegmentsEqual>;

    auto walk(Segments parts) const -> Expected<Json const*>;
    auto insert(Segments parts, NodeRef node) -> void;

    NodeRef                    tree;
    bool                       enabled = true;
    std::optional<std::size_t> maxSize;
    CacheList                  entries; // most recently used first
    CacheIndex                 index;
    mutable LookupCacheMetrics metrics;
};

} // namespace TP
