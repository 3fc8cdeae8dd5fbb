#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace TP {

// One path component. The alternative index doubles as the ordering rank,
// so integer indices sort before text keys and 0 never equals "0".
using Segment  = std::variant<std::int64_t, std::string>;
using Segments = std::span<Segment const>;

auto segmentToString(Segment const& segment) -> std::string;
auto isIndex(Segment const& segment) -> bool;
auto segmentHash(Segment const& segment) -> std::size_t;

// Hash and equality over segment sequences, usable for heterogeneous lookup
// with either an owning vector or a span.
struct SegmentsHash {
    using is_transparent = void;
    auto operator()(Segments segments) const -> std::size_t;
    auto operator()(std::vector<Segment> const& segments) const -> std::size_t {
        return (*this)(Segments{segments});
    }
};

struct SegmentsEqual {
    using is_transparent = void;
    auto operator()(Segments lhs, Segments rhs) const -> bool;
};

} // namespace TP
