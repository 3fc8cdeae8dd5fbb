#pragma once
#include "accessor/FileHandle.hpp"
#include "accessor/NodeAccessor.hpp"

#include <filesystem>

namespace TP {

/**
 * Accessor resolving segments as entries below a base directory.
 *
 * Nothing is cached: every call reflects the filesystem at call time, so two
 * identical calls may disagree if the tree changed in between. Integer
 * segments are used by their decimal text. stat() does not follow symlinks.
 */
class FilesystemAccessor final : public NodeAccessor<Bytes, FileHandle> {
public:
    explicit FilesystemAccessor(std::filesystem::path root);

    [[nodiscard]] auto root() const -> std::filesystem::path const& { return this->base; }

    auto stat(Segments parts) const -> std::optional<Stat> override;
    auto validate(Segments parts) const -> Expected<void> override;
    auto resolve(Segments parts) -> Expected<Bytes> override;
    auto keys(Segments parts) const -> Expected<std::vector<Segment>> override;
    auto open(Segments parts) -> Expected<FileHandle> override;
    auto isTraversable(Segments parts) const -> bool override;

private:
    auto target(Segments parts) const -> std::filesystem::path;
    // Walks the segments one entry at a time and reports the first one that is missing.
    auto locate(Segments parts) const -> Expected<std::filesystem::path>;

    std::filesystem::path base;
};

} // namespace TP
