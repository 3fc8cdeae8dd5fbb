#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace TP {

// Metadata for one resolved node. Fields an accessor cannot supply stay empty.
struct Stat {
    enum class Kind {
        Mapping,
        Sequence,
        Scalar,
        File,
        Directory,
        Symlink,
        Other
    };

    Kind                                          kind = Kind::Other;
    std::optional<std::size_t>                    length;
    std::optional<std::uintmax_t>                 size;
    std::optional<std::filesystem::file_time_type> modified;
    std::optional<std::filesystem::perms>          permissions;
};

[[nodiscard]] inline auto statKindToString(Stat::Kind kind) -> std::string_view {
    switch (kind) {
    case Stat::Kind::Mapping:
        return "mapping";
    case Stat::Kind::Sequence:
        return "sequence";
    case Stat::Kind::Scalar:
        return "scalar";
    case Stat::Kind::File:
        return "file";
    case Stat::Kind::Directory:
        return "directory";
    case Stat::Kind::Symlink:
        return "symlink";
    case Stat::Kind::Other:
        return "other";
    }
    return "other";
}

} // namespace TP
