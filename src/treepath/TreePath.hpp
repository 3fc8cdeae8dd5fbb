#pragma once

#include "BoundPath.hpp"
#include "accessor/FilesystemAccessor.hpp"
#include "accessor/LookupAccessor.hpp"
#include "core/Error.hpp"
#include "path/PathValue.hpp"

#include <filesystem>
#include <memory>

namespace TP {

using LookupPath     = BoundPath<NodeRef>;
using FilesystemPath = BoundPath<Bytes, FileHandle>;

// Root path over an in-memory tree. Keep the accessor to reach the cache controls.
auto fromLookup(Json tree, char separator = PathValue::DefaultSeparator) -> LookupPath;
auto fromLookup(std::shared_ptr<LookupAccessor> accessor, char separator = PathValue::DefaultSeparator) -> LookupPath;

// Root path over the entries below baseDirectory.
auto fromPath(std::filesystem::path baseDirectory, char separator = PathValue::DefaultSeparator) -> FilesystemPath;

} // namespace TP
