#pragma once
#include "accessor/Stat.hpp"
#include "core/Error.hpp"
#include "path/Segment.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace TP {

/**
 * Capability interface a backend implements to resolve segment sequences
 * against its root.
 *
 * - stat/exists/contains/isTraversable never fail; a missing path is reported
 *   as an empty result or false.
 * - resolve/keys/length/validate report the first segment that cannot be
 *   applied (KeyMissing, IndexOutOfRange or NotIndexable).
 * - open returns a scoped handle that releases its resource when destroyed.
 *
 * An accessor holds only its root. Paths are passed in on every call and no
 * reference into the backend is kept between calls.
 */
template <typename V, typename H = V>
class NodeAccessor {
public:
    using Value  = V;
    using Handle = H;

    virtual ~NodeAccessor() = default;

    virtual auto stat(Segments parts) const -> std::optional<Stat>       = 0;
    virtual auto validate(Segments parts) const -> Expected<void>         = 0;
    virtual auto resolve(Segments parts) -> Expected<Value>               = 0;
    virtual auto keys(Segments parts) const -> Expected<std::vector<Segment>> = 0;
    virtual auto open(Segments parts) -> Expected<Handle>                 = 0;

    virtual auto exists(Segments parts) const -> bool {
        return this->stat(parts).has_value();
    }

    virtual auto contains(Segments parts, Segment const& key) const -> bool {
        auto const child = childParts(parts, key);
        return this->exists(child);
    }

    virtual auto length(Segments parts) const -> Expected<std::size_t> {
        auto children = this->keys(parts);
        if (!children)
            return std::unexpected(children.error());
        return children->size();
    }

    virtual auto isTraversable(Segments parts) const -> bool {
        return this->keys(parts).has_value();
    }

    auto items(Segments parts) -> Expected<std::vector<std::pair<Segment, Value>>>;
    auto values(Segments parts) -> Expected<std::vector<Value>>;

protected:
    static auto childParts(Segments parts, Segment const& key) -> std::vector<Segment> {
        std::vector<Segment> child(parts.begin(), parts.end());
        child.push_back(key);
        return child;
    }
};

template <typename V, typename H>
auto NodeAccessor<V, H>::items(Segments parts) -> Expected<std::vector<std::pair<Segment, Value>>> {
    auto children = this->keys(parts);
    if (!children)
        return std::unexpected(children.error());

    std::vector<std::pair<Segment, Value>> result;
    result.reserve(children->size());
    for (auto& key : *children) {
        auto value = this->resolve(childParts(parts, key));
        if (!value)
            return std::unexpected(value.error());
        result.emplace_back(std::move(key), std::move(*value));
    }
    return result;
}

template <typename V, typename H>
auto NodeAccessor<V, H>::values(Segments parts) -> Expected<std::vector<Value>> {
    auto children = this->items(parts);
    if (!children)
        return std::unexpected(children.error());

    std::vector<Value> result;
    result.reserve(children->size());
    for (auto& entry : *children)
        result.push_back(std::move(entry.second));
    return result;
}

} // namespace TP
