#include "FilesystemAccessor.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

using TP::Error;

auto describe_position(TP::Segment const& segment, std::size_t position) -> std::string {
    return "'" + TP::segmentToString(segment) + "' (segment " + std::to_string(position) + ")";
}

auto is_missing(std::error_code const& ec) -> bool {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

auto kind_of(fs::file_status const& status) -> TP::Stat::Kind {
    switch (status.type()) {
    case fs::file_type::regular:
        return TP::Stat::Kind::File;
    case fs::file_type::directory:
        return TP::Stat::Kind::Directory;
    case fs::file_type::symlink:
        return TP::Stat::Kind::Symlink;
    default:
        return TP::Stat::Kind::Other;
    }
}

} // namespace

namespace TP {

FilesystemAccessor::FilesystemAccessor(fs::path root)
    : base(std::move(root)) {}

auto FilesystemAccessor::target(Segments parts) const -> fs::path {
    auto path = this->base;
    for (auto const& segment : parts)
        path /= segmentToString(segment);
    return path;
}

auto FilesystemAccessor::locate(Segments parts) const -> Expected<fs::path> {
    auto current = this->base;
    for (std::size_t position = 0; position < parts.size(); ++position) {
        std::error_code ec;
        if (!fs::is_directory(current, ec)) {
            if (ec && !is_missing(ec))
                return std::unexpected(Error{Error::Code::IoFailure, "Cannot inspect '" + current.string() + "': " + ec.message()});
            if (position > 0 || fs::exists(current, ec))
                return std::unexpected(Error{Error::Code::NotIndexable,
                                             "Cannot descend into non-directory '" + current.string() + "' with "
                                                 + describe_position(parts[position], position)});
        }
        current /= segmentToString(parts[position]);
        auto const status = fs::symlink_status(current, ec);
        if (ec && !is_missing(ec))
            return std::unexpected(Error{Error::Code::IoFailure, "Cannot inspect '" + current.string() + "': " + ec.message()});
        if (!fs::exists(status))
            return std::unexpected(Error{Error::Code::KeyMissing, "Entry " + describe_position(parts[position], position) + " not found"});
    }
    return current;
}

auto FilesystemAccessor::stat(Segments parts) const -> std::optional<Stat> {
    auto const      path = this->target(parts);
    std::error_code ec;
    auto const      status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status))
        return std::nullopt;

    Stat result;
    result.kind        = kind_of(status);
    result.permissions = status.permissions();
    if (result.kind == Stat::Kind::File) {
        auto const size = fs::file_size(path, ec);
        if (!ec)
            result.size = size;
    }
    if (result.kind != Stat::Kind::Symlink) {
        auto const modified = fs::last_write_time(path, ec);
        if (!ec)
            result.modified = modified;
    }
    return result;
}

auto FilesystemAccessor::validate(Segments parts) const -> Expected<void> {
    auto path = this->locate(parts);
    if (!path)
        return std::unexpected(path.error());
    return {};
}

auto FilesystemAccessor::resolve(Segments parts) -> Expected<Bytes> {
    auto path = this->locate(parts);
    if (!path)
        return std::unexpected(path.error());

    std::error_code ec;
    if (fs::is_directory(*path, ec))
        return std::unexpected(Error{Error::Code::IsDirectory, "Is a directory: '" + path->string() + "'"});

    auto handle = FileHandle::open(*path);
    if (!handle)
        return std::unexpected(handle.error());
    return handle->read();
}

auto FilesystemAccessor::keys(Segments parts) const -> Expected<std::vector<Segment>> {
    auto path = this->locate(parts);
    if (!path)
        return std::unexpected(path.error());

    std::error_code ec;
    if (!fs::is_directory(*path, ec))
        return std::unexpected(Error{Error::Code::NotIndexable, "Not a directory: '" + path->string() + "'"});

    std::vector<std::string> names;
    for (fs::directory_iterator it{*path, ec}, end; !ec && it != end; it.increment(ec))
        names.push_back(it->path().filename().string());
    if (ec)
        return std::unexpected(Error{Error::Code::IoFailure, "Cannot list directory '" + path->string() + "': " + ec.message()});
    std::ranges::sort(names);

    std::vector<Segment> result;
    result.reserve(names.size());
    for (auto& name : names)
        result.emplace_back(std::move(name));
    return result;
}

auto FilesystemAccessor::open(Segments parts) -> Expected<FileHandle> {
    auto path = this->locate(parts);
    if (!path)
        return std::unexpected(path.error());
    return FileHandle::open(*path);
}

auto FilesystemAccessor::isTraversable(Segments parts) const -> bool {
    auto path = this->locate(parts);
    if (!path)
        return false;
    std::error_code ec;
    return fs::is_directory(*path, ec);
}

} // namespace TP
