#pragma once
#include "accessor/NodeAccessor.hpp"
#include "path/PathValue.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TP {

/**
 * A PathValue bound to an accessor.
 *
 * Composition returns a new BoundPath sharing the same accessor instance;
 * the accessor is never copied or modified by composition. Reads delegate to
 * the accessor with this path's parts and hold nothing between calls.
 */
template <typename V, typename H = V>
class BoundPath {
public:
    using Accessor = NodeAccessor<V, H>;
    using Value    = V;
    using Handle   = H;

    explicit BoundPath(std::shared_ptr<Accessor> accessor, PathValue path = {})
        : resolver(std::move(accessor)), location(std::move(path)) {}

    [[nodiscard]] auto path() const -> PathValue const& { return this->location; }
    [[nodiscard]] auto parts() const -> std::vector<Segment> const& { return this->location.parts(); }
    [[nodiscard]] auto separator() const -> char { return this->location.separator(); }
    [[nodiscard]] auto str() const -> std::string const& { return this->location.str(); }
    [[nodiscard]] auto name() const -> std::string { return this->location.name(); }
    [[nodiscard]] auto accessor() const -> std::shared_ptr<Accessor> const& { return this->resolver; }

    [[nodiscard]] auto join(Segment const& segment) const -> BoundPath { return this->rebind(this->location.join(segment)); }
    [[nodiscard]] auto join(PathValue const& other) const -> BoundPath { return this->rebind(this->location.join(other)); }
    auto operator/(Segment const& segment) const -> BoundPath { return this->join(segment); }
    auto operator/(PathValue const& other) const -> BoundPath { return this->join(other); }

    // join() that fails with KeyMissing unless the result resolves.
    [[nodiscard]] auto strictJoin(Segment const& segment) const -> Expected<BoundPath>;
    [[nodiscard]] auto parent() const -> Expected<BoundPath>;

    [[nodiscard]] auto readValue() const -> Expected<Value> { return this->resolver->resolve(this->parts()); }
    [[nodiscard]] auto at(Segment const& key) const -> Expected<Value>;
    [[nodiscard]] auto get(Segment const& key) const -> std::optional<Value>;
    [[nodiscard]] auto get(Segment const& key, Value fallback) const -> Value;

    [[nodiscard]] auto exists() const -> bool { return this->resolver->exists(this->parts()); }
    [[nodiscard]] auto contains(Segment const& key) const -> bool { return this->join(key).exists(); }
    [[nodiscard]] auto isTraversable() const -> bool { return this->resolver->isTraversable(this->parts()); }
    [[nodiscard]] auto length() const -> Expected<std::size_t> { return this->resolver->length(this->parts()); }
    [[nodiscard]] auto stat() const -> std::optional<Stat> { return this->resolver->stat(this->parts()); }

    [[nodiscard]] auto keys() const -> Expected<std::vector<Segment>> { return this->resolver->keys(this->parts()); }
    // Enumeration yields child paths and never reads them, so a directory
    // holding subdirectories enumerates like any other node.
    [[nodiscard]] auto items() const -> Expected<std::vector<std::pair<Segment, BoundPath>>>;
    [[nodiscard]] auto values() const -> Expected<std::vector<BoundPath>> { return this->children(); }
    // One child path per key, in key order.
    [[nodiscard]] auto children() const -> Expected<std::vector<BoundPath>>;

    [[nodiscard]] auto open() const -> Expected<Handle> { return this->resolver->open(this->parts()); }

    auto operator==(BoundPath const& other) const -> bool {
        return this->resolver == other.resolver && this->location == other.location;
    }

private:
    auto rebind(PathValue path) const -> BoundPath { return BoundPath{this->resolver, std::move(path)}; }

    std::shared_ptr<Accessor> resolver;
    PathValue                 location;
};

template <typename V, typename H>
auto BoundPath<V, H>::strictJoin(Segment const& segment) const -> Expected<BoundPath> {
    auto child = this->join(segment);
    if (auto valid = this->resolver->validate(child.parts()); !valid) {
        auto const& error = valid.error();
        if (error.code == Error::Code::IoFailure)
            return std::unexpected(error);
        return std::unexpected(Error{Error::Code::KeyMissing, error.message.value_or("'" + child.str() + "' does not exist")});
    }
    return child;
}

template <typename V, typename H>
auto BoundPath<V, H>::parent() const -> Expected<BoundPath> {
    auto up = this->location.parent();
    if (!up)
        return std::unexpected(up.error());
    return this->rebind(std::move(*up));
}

template <typename V, typename H>
auto BoundPath<V, H>::at(Segment const& key) const -> Expected<Value> {
    auto child = this->strictJoin(key);
    if (!child)
        return std::unexpected(child.error());
    return child->readValue();
}

template <typename V, typename H>
auto BoundPath<V, H>::get(Segment const& key) const -> std::optional<Value> {
    auto value = this->join(key).readValue();
    if (!value)
        return std::nullopt;
    return std::move(*value);
}

template <typename V, typename H>
auto BoundPath<V, H>::get(Segment const& key, Value fallback) const -> Value {
    auto value = this->get(key);
    if (!value)
        return fallback;
    return std::move(*value);
}

template <typename V, typename H>
auto BoundPath<V, H>::items() const -> Expected<std::vector<std::pair<Segment, BoundPath>>> {
    auto names = this->keys();
    if (!names)
        return std::unexpected(names.error());

    std::vector<std::pair<Segment, BoundPath>> result;
    result.reserve(names->size());
    for (auto& key : *names) {
        auto child = this->rebind(this->location.appendVerbatim(key));
        result.emplace_back(std::move(key), std::move(child));
    }
    return result;
}

template <typename V, typename H>
auto BoundPath<V, H>::children() const -> Expected<std::vector<BoundPath>> {
    auto names = this->keys();
    if (!names)
        return std::unexpected(names.error());

    std::vector<BoundPath> result;
    result.reserve(names->size());
    for (auto const& key : *names)
        result.push_back(this->rebind(this->location.appendVerbatim(key)));
    return result;
}

} // namespace TP
