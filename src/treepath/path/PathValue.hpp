#pragma once
#include "core/Error.hpp"
#include "path/Segment.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace TP {

/**
 * Immutable location inside a nested tree: an ordered list of segments plus
 * the separator used to parse and render it.
 *
 * Text segments are split on the separator when supplied, and empty or "."
 * tokens are dropped. Integer segments are stored as-is; text is never coerced
 * into an integer. Every operation returns a new value.
 *
 * Ordering is lexicographic over (separator, parts) where a segment compares
 * by kind first (integers before text) and then by its natural order.
 */
class PathValue {
public:
    static constexpr char DefaultSeparator = '/';

    PathValue() = default;
    explicit PathValue(char separator);
    explicit PathValue(std::string_view text, char separator = DefaultSeparator);
    explicit PathValue(char const* text, char separator = DefaultSeparator);
    PathValue(std::initializer_list<Segment> segments, char separator = DefaultSeparator);
    explicit PathValue(Segments segments, char separator = DefaultSeparator);

    static auto parse(std::string_view input, char separator = DefaultSeparator) -> PathValue;

    [[nodiscard]] auto parts() const -> std::vector<Segment> const& { return this->segments; }
    [[nodiscard]] auto separator() const -> char { return this->sep; }
    [[nodiscard]] auto empty() const -> bool { return this->segments.empty(); }
    [[nodiscard]] auto size() const -> std::size_t { return this->segments.size(); }

    // Rendered once at construction.
    [[nodiscard]] auto str() const -> std::string const& { return this->rendered; }
    [[nodiscard]] auto asPosix() const -> std::string;

    [[nodiscard]] auto join(Segment const& segment) const -> PathValue;
    [[nodiscard]] auto join(PathValue const& other) const -> PathValue;
    [[nodiscard]] auto prepend(Segment const& segment) const -> PathValue;
    // Appends one segment as-is, without splitting; for keys reported by an accessor.
    [[nodiscard]] auto appendVerbatim(Segment const& segment) const -> PathValue;
    auto operator/(Segment const& segment) const -> PathValue { return this->join(segment); }
    auto operator/(PathValue const& other) const -> PathValue { return this->join(other); }

    [[nodiscard]] auto parent() const -> Expected<PathValue>;
    [[nodiscard]] auto parents() const -> std::vector<PathValue>;

    [[nodiscard]] auto name() const -> std::string;
    [[nodiscard]] auto stem() const -> std::string;
    [[nodiscard]] auto suffix() const -> std::string;
    [[nodiscard]] auto suffixes() const -> std::vector<std::string>;
    [[nodiscard]] auto withName(std::string_view newName) const -> Expected<PathValue>;
    [[nodiscard]] auto withSuffix(std::string_view newSuffix) const -> Expected<PathValue>;

    [[nodiscard]] auto isRelativeTo(PathValue const& base) const -> bool;
    [[nodiscard]] auto relativeTo(PathValue const& base) const -> Expected<PathValue>;

    [[nodiscard]] auto hash() const -> std::size_t;

    auto operator==(PathValue const& other) const -> bool;
    auto operator<=>(PathValue const& other) const -> std::strong_ordering;

private:
    struct Normalized {};
    PathValue(Normalized, std::vector<Segment> parts, char separator);

    static auto appendNormalized(std::vector<Segment>& out, Segment const& segment, char separator) -> void;
    auto        withParts(std::vector<Segment> parts) const -> PathValue;

    char                 sep = DefaultSeparator;
    std::vector<Segment> segments;
    std::string          rendered;
};

auto operator<<(std::ostream& os, PathValue const& path) -> std::ostream&;

} // namespace TP

template <>
struct std::hash<TP::PathValue> {
    auto operator()(TP::PathValue const& path) const noexcept -> std::size_t {
        return path.hash();
    }
};
