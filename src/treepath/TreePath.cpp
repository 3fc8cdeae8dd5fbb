#include "TreePath.hpp"

#include <utility>

namespace TP {

auto fromLookup(Json tree, char separator) -> LookupPath {
    return fromLookup(LookupAccessor::create(std::move(tree)), separator);
}

auto fromLookup(std::shared_ptr<LookupAccessor> accessor, char separator) -> LookupPath {
    return LookupPath{std::move(accessor), PathValue(separator)};
}

auto fromPath(std::filesystem::path baseDirectory, char separator) -> FilesystemPath {
    return FilesystemPath{std::make_shared<FilesystemAccessor>(std::move(baseDirectory)), PathValue(separator)};
}

} // namespace TP
