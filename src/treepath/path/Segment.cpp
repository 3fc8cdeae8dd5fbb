#include "Segment.hpp"

#include <algorithm>
#include <functional>

namespace TP {

auto segmentToString(Segment const& segment) -> std::string {
    if (auto const* index = std::get_if<std::int64_t>(&segment))
        return std::to_string(*index);
    return std::get<std::string>(segment);
}

auto isIndex(Segment const& segment) -> bool {
    return std::holds_alternative<std::int64_t>(segment);
}

auto segmentHash(Segment const& segment) -> std::size_t {
    return std::hash<Segment>{}(segment);
}

auto SegmentsHash::operator()(Segments segments) const -> std::size_t {
    std::size_t seed = segments.size();
    for (auto const& segment : segments) {
        // boost::hash_combine mixing
        seed ^= segmentHash(segment) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

auto SegmentsEqual::operator()(Segments lhs, Segments rhs) const -> bool {
    return std::ranges::equal(lhs, rhs);
}

} // namespace TP
