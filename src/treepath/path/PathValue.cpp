#include "PathValue.hpp"

#include <algorithm>
#include <ostream>
#include <utility>

namespace {

using TP::Error;

struct StemSuffix {
    std::string stem;
    std::string suffix;
};

auto is_dot_name(std::string_view name) -> bool {
    return name.empty() || name == "." || name == "..";
}

// pathlib rules: a leading dot starts a hidden name, not a suffix.
auto split_stem_suffix(std::string const& name) -> StemSuffix {
    if (is_dot_name(name))
        return {name, {}};
    auto const dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0)
        return {name, {}};
    return {name.substr(0, dot), name.substr(dot)};
}

auto render(std::vector<TP::Segment> const& parts, char separator) -> std::string {
    std::string out;
    for (std::size_t idx = 0; idx < parts.size(); ++idx) {
        if (idx > 0)
            out.push_back(separator);
        out += TP::segmentToString(parts[idx]);
    }
    return out;
}

auto make_invalid_name(std::string message) -> Error {
    return Error{Error::Code::InvalidName, std::move(message)};
}

} // namespace

namespace TP {

PathValue::PathValue(char separator)
    : sep(separator) {}

PathValue::PathValue(std::string_view text, char separator)
    : sep(separator) {
    appendNormalized(this->segments, Segment{std::string{text}}, this->sep);
    this->rendered = render(this->segments, this->sep);
}

PathValue::PathValue(char const* text, char separator)
    : PathValue(std::string_view{text}, separator) {}

PathValue::PathValue(std::initializer_list<Segment> segments, char separator)
    : PathValue(Segments{segments.begin(), segments.size()}, separator) {}

PathValue::PathValue(Segments segments, char separator)
    : sep(separator) {
    for (auto const& segment : segments)
        appendNormalized(this->segments, segment, this->sep);
    this->rendered = render(this->segments, this->sep);
}

PathValue::PathValue(Normalized, std::vector<Segment> parts, char separator)
    : sep(separator), segments(std::move(parts)) {
    this->rendered = render(this->segments, this->sep);
}

auto PathValue::parse(std::string_view input, char separator) -> PathValue {
    return PathValue(input, separator);
}

auto PathValue::appendNormalized(std::vector<Segment>& out, Segment const& segment, char separator) -> void {
    if (isIndex(segment)) {
        out.push_back(segment);
        return;
    }
    std::string_view rest{std::get<std::string>(segment)};
    while (true) {
        auto const next  = rest.find(separator);
        auto const token = rest.substr(0, next);
        if (!token.empty() && token != ".")
            out.emplace_back(std::string{token});
        if (next == std::string_view::npos)
            break;
        rest.remove_prefix(next + 1);
    }
}

auto PathValue::withParts(std::vector<Segment> parts) const -> PathValue {
    return PathValue{Normalized{}, std::move(parts), this->sep};
}

auto PathValue::asPosix() const -> std::string {
    return render(this->segments, '/');
}

auto PathValue::join(Segment const& segment) const -> PathValue {
    auto parts = this->segments;
    appendNormalized(parts, segment, this->sep);
    return this->withParts(std::move(parts));
}

auto PathValue::join(PathValue const& other) const -> PathValue {
    auto parts = this->segments;
    parts.insert(parts.end(), other.segments.begin(), other.segments.end());
    return this->withParts(std::move(parts));
}

auto PathValue::prepend(Segment const& segment) const -> PathValue {
    std::vector<Segment> parts;
    appendNormalized(parts, segment, this->sep);
    parts.insert(parts.end(), this->segments.begin(), this->segments.end());
    return this->withParts(std::move(parts));
}

auto PathValue::appendVerbatim(Segment const& segment) const -> PathValue {
    auto parts = this->segments;
    parts.push_back(segment);
    return this->withParts(std::move(parts));
}

auto PathValue::parent() const -> Expected<PathValue> {
    if (this->segments.empty())
        return std::unexpected(Error{Error::Code::EmptyPath, "Empty path has no parent"});
    return this->withParts({this->segments.begin(), this->segments.end() - 1});
}

auto PathValue::parents() const -> std::vector<PathValue> {
    std::vector<PathValue> result;
    result.reserve(this->segments.size());
    for (auto count = this->segments.size(); count > 0; --count)
        result.push_back(this->withParts({this->segments.begin(), this->segments.begin() + (count - 1)}));
    return result;
}

auto PathValue::name() const -> std::string {
    if (this->segments.empty())
        return {};
    return segmentToString(this->segments.back());
}

auto PathValue::stem() const -> std::string {
    return split_stem_suffix(this->name()).stem;
}

auto PathValue::suffix() const -> std::string {
    return split_stem_suffix(this->name()).suffix;
}

auto PathValue::suffixes() const -> std::vector<std::string> {
    std::vector<std::string> result;
    auto const               full = this->name();
    std::string_view         view{full};
    if (is_dot_name(view))
        return result;
    if (view.front() == '.') {
        view.remove_prefix(1);
        if (view.find('.') == std::string_view::npos)
            return result;
    }
    auto dot = view.find('.');
    while (dot != std::string_view::npos) {
        auto const next = view.find('.', dot + 1);
        result.emplace_back(view.substr(dot, next == std::string_view::npos ? std::string_view::npos : next - dot));
        dot = next;
    }
    return result;
}

auto PathValue::withName(std::string_view newName) const -> Expected<PathValue> {
    if (this->segments.empty())
        return std::unexpected(make_invalid_name("withName requires a non-empty path"));
    if (newName.empty())
        return std::unexpected(make_invalid_name("Name must be non-empty"));
    // "." is dropped by parsing and would not survive a round trip; ".." is an ordinary key.
    if (newName == ".")
        return std::unexpected(make_invalid_name("Invalid name '.'"));
    if (newName.find(this->sep) != std::string_view::npos)
        return std::unexpected(make_invalid_name("Name must not contain the path separator"));
    auto parts   = this->segments;
    parts.back() = std::string{newName};
    return this->withParts(std::move(parts));
}

auto PathValue::withSuffix(std::string_view newSuffix) const -> Expected<PathValue> {
    if (this->segments.empty())
        return std::unexpected(make_invalid_name("withSuffix requires a non-empty path"));
    if (!newSuffix.empty() && newSuffix.front() != '.')
        return std::unexpected(make_invalid_name("Invalid suffix '" + std::string{newSuffix} + "'; must start with '.'"));
    auto const current = this->name();
    if (is_dot_name(current))
        return std::unexpected(make_invalid_name("Invalid name '" + current + "' for withSuffix"));
    return this->withName(this->stem() + std::string{newSuffix});
}

auto PathValue::isRelativeTo(PathValue const& base) const -> bool {
    if (this->sep != base.sep)
        return false;
    if (base.segments.size() > this->segments.size())
        return false;
    return std::equal(base.segments.begin(), base.segments.end(), this->segments.begin());
}

auto PathValue::relativeTo(PathValue const& base) const -> Expected<PathValue> {
    if (!this->isRelativeTo(base))
        return std::unexpected(Error{Error::Code::PathMismatch,
                                     "'" + this->rendered + "' is not in the subpath of '" + base.rendered + "'"});
    return this->withParts({this->segments.begin() + base.segments.size(), this->segments.end()});
}

auto PathValue::hash() const -> std::size_t {
    auto seed = SegmentsHash{}(this->segments);
    seed ^= std::hash<char>{}(this->sep) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
}

auto PathValue::operator==(PathValue const& other) const -> bool {
    return this->sep == other.sep && this->segments == other.segments;
}

auto PathValue::operator<=>(PathValue const& other) const -> std::strong_ordering {
    if (auto const cmp = this->sep <=> other.sep; cmp != 0)
        return cmp;
    return this->segments <=> other.segments;
}

auto operator<<(std::ostream& os, PathValue const& path) -> std::ostream& {
    return os << path.str();
}

} // namespace TP
