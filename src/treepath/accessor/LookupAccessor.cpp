#include "LookupAccessor.hpp"

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>

namespace {

using TP::Error;
using TP::Expected;
using TP::Json;
using TP::Segment;

auto describe_position(Segment const& segment, std::size_t position) -> std::string {
    return "'" + TP::segmentToString(segment) + "' (segment " + std::to_string(position) + ")";
}

// One descent step; the error names the segment that could not be applied.
auto descend(Json const& node, Segment const& segment, std::size_t position) -> Expected<Json const*> {
    if (node.is_object()) {
        auto const* key = std::get_if<std::string>(&segment);
        if (key == nullptr)
            return std::unexpected(Error{Error::Code::KeyMissing,
                                         "Index " + describe_position(segment, position) + " used on a mapping"});
        auto it = node.find(*key);
        if (it == node.end())
            return std::unexpected(Error{Error::Code::KeyMissing, "Key " + describe_position(segment, position) + " not found"});
        return &*it;
    }
    if (node.is_array()) {
        auto const* index = std::get_if<std::int64_t>(&segment);
        if (index == nullptr)
            return std::unexpected(Error{Error::Code::KeyMissing,
                                         "Text key " + describe_position(segment, position) + " used on a sequence"});
        if (*index < 0 || static_cast<std::size_t>(*index) >= node.size())
            return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                         "Index " + describe_position(segment, position) + " out of range for sequence of length "
                                             + std::to_string(node.size())});
        return &node[static_cast<std::size_t>(*index)];
    }
    return std::unexpected(Error{Error::Code::NotIndexable,
                                 "Cannot descend into " + std::string{node.type_name()} + " with " + describe_position(segment, position)});
}

auto is_container(Json const& node) -> bool {
    return node.is_object() || node.is_array();
}

} // namespace

namespace TP {

LookupAccessor::LookupAccessor(Json tree, LookupCacheOptions options)
    : LookupAccessor(std::make_shared<Json>(std::move(tree)), options) {}

LookupAccessor::LookupAccessor(std::shared_ptr<Json const> tree, LookupCacheOptions options)
    : tree(std::move(tree)), enabled(options.enabled), maxSize(options.maxSize) {
    if (!this->tree)
        this->tree = std::make_shared<Json>();
    // A zero capacity cannot hold anything; treat it as disabled.
    if (this->maxSize && *this->maxSize == 0)
        this->enabled = false;
}

auto LookupAccessor::create(Json tree, LookupCacheOptions options) -> std::shared_ptr<LookupAccessor> {
    return std::make_shared<LookupAccessor>(std::move(tree), options);
}

auto LookupAccessor::walk(Segments parts) const -> Expected<Json const*> {
    ++this->metrics.walks;
    Json const* current = this->tree.get();
    for (std::size_t position = 0; position < parts.size(); ++position) {
        auto next = descend(*current, parts[position], position);
        if (!next)
            return std::unexpected(next.error());
        current = *next;
    }
    return current;
}

auto LookupAccessor::stat(Segments parts) const -> std::optional<Stat> {
    auto node = this->walk(parts);
    if (!node)
        return std::nullopt;

    Json const& value = **node;
    Stat        result;
    if (value.is_object()) {
        result.kind   = Stat::Kind::Mapping;
        result.length = value.size();
    } else if (value.is_array()) {
        result.kind   = Stat::Kind::Sequence;
        result.length = value.size();
    } else {
        result.kind = Stat::Kind::Scalar;
        if (value.is_string())
            result.length = value.get_ref<std::string const&>().size();
    }
    return result;
}

auto LookupAccessor::validate(Segments parts) const -> Expected<void> {
    auto node = this->walk(parts);
    if (!node)
        return std::unexpected(node.error());
    return {};
}

auto LookupAccessor::resolve(Segments parts) -> Expected<NodeRef> {
    if (this->enabled) {
        auto it = this->index.find(parts);
        if (it != this->index.end()) {
            ++this->metrics.hits;
            this->entries.splice(this->entries.begin(), this->entries, it->second);
            return it->second->node;
        }
        ++this->metrics.misses;
    }

    auto node = this->walk(parts);
    if (!node)
        return std::unexpected(node.error());

    NodeRef ref{this->tree, *node};
    if (this->enabled)
        this->insert(parts, ref);
    return ref;
}

auto LookupAccessor::insert(Segments parts, NodeRef node) -> void {
    this->entries.push_front(CacheEntry{{parts.begin(), parts.end()}, std::move(node)});
    this->index.emplace(this->entries.front().key, this->entries.begin());

    if (!this->maxSize)
        return;
    while (this->entries.size() > *this->maxSize) {
        auto& victim = this->entries.back();
        tp_log("Evicting cached node for " + std::to_string(victim.key.size()) + " segment(s)", "LookupCache");
        this->index.erase(victim.key);
        this->entries.pop_back();
        ++this->metrics.evictions;
    }
}

auto LookupAccessor::keys(Segments parts) const -> Expected<std::vector<Segment>> {
    auto node = this->walk(parts);
    if (!node)
        return std::unexpected(node.error());

    Json const&          value = **node;
    std::vector<Segment> result;
    if (value.is_object()) {
        result.reserve(value.size());
        for (auto it = value.begin(); it != value.end(); ++it)
            result.emplace_back(it.key());
        return result;
    }
    if (value.is_array()) {
        result.reserve(value.size());
        for (std::size_t idx = 0; idx < value.size(); ++idx)
            result.emplace_back(static_cast<std::int64_t>(idx));
        return result;
    }
    return std::unexpected(Error{Error::Code::NotIndexable,
                                 "Cannot enumerate children of " + std::string{value.type_name()}});
}

auto LookupAccessor::open(Segments parts) -> Expected<NodeRef> {
    return this->resolve(parts);
}

auto LookupAccessor::contains(Segments parts, Segment const& key) const -> bool {
    auto node = this->walk(parts);
    if (!node)
        return false;
    return descend(**node, key, parts.size()).has_value();
}

auto LookupAccessor::length(Segments parts) const -> Expected<std::size_t> {
    auto node = this->walk(parts);
    if (!node)
        return std::unexpected(node.error());
    if (!is_container(**node))
        return std::unexpected(Error{Error::Code::NotIndexable,
                                     "Cannot count children of " + std::string{(*node)->type_name()}});
    return (*node)->size();
}

auto LookupAccessor::isTraversable(Segments parts) const -> bool {
    auto node = this->walk(parts);
    return node && is_container(**node);
}

auto LookupAccessor::isCached(Segments parts) const -> bool {
    return this->index.contains(parts);
}

auto LookupAccessor::clearCache() -> void {
    this->index.clear();
    this->entries.clear();
}

auto LookupAccessor::disableCache() -> void {
    tp_log("Lookup cache disabled", "LookupAccessor");
    this->enabled = false;
    this->clearCache();
}

auto LookupAccessor::enableCache(std::optional<std::size_t> maxSize) -> Expected<void> {
    if (maxSize && *maxSize == 0)
        return std::unexpected(Error{Error::Code::InvalidCacheSize, "Cache capacity must be positive"});
    tp_log("Lookup cache enabled with capacity "
               + (maxSize ? std::to_string(*maxSize) : std::string{"unbounded"}),
           "LookupAccessor");
    this->enabled = true;
    this->maxSize = maxSize;
    this->clearCache();
    return {};
}

auto LookupAccessor::resetCacheMetrics() -> void {
    this->metrics = {};
}

} // namespace TP
