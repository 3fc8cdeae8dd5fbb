#include "FileHandle.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace TP {

auto FileHandle::open(fs::path const& path) -> Expected<FileHandle> {
    std::error_code ec;
    auto const      status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        return std::unexpected(Error{Error::Code::KeyMissing, "No such file or directory: '" + path.string() + "'"});

    if (fs::is_directory(status)) {
        std::vector<std::string> names;
        for (fs::directory_iterator it{path, ec}, end; !ec && it != end; it.increment(ec))
            names.push_back(it->path().filename().string());
        if (ec)
            return std::unexpected(Error{Error::Code::IoFailure, "Cannot list directory '" + path.string() + "': " + ec.message()});
        std::ranges::sort(names);
        tp_log("Opened directory handle " + path.string(), "FilesystemAccessor");
        return FileHandle{path, std::move(names)};
    }

    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
        return std::unexpected(Error{Error::Code::IoFailure, "Cannot open file '" + path.string() + "'"});
    tp_log("Opened file handle " + path.string(), "FilesystemAccessor");
    return FileHandle{path, std::move(stream)};
}

FileHandle::FileHandle(fs::path path, std::ifstream stream)
    : location(std::move(path)), file(std::move(stream)), directory(false), opened(true) {}

FileHandle::FileHandle(fs::path path, std::vector<std::string> listing)
    : location(std::move(path)), listing(std::move(listing)), directory(true), opened(true) {}

FileHandle::FileHandle(FileHandle&& other) noexcept
    : location(std::move(other.location)),
      file(std::move(other.file)),
      listing(std::move(other.listing)),
      directory(other.directory),
      opened(std::exchange(other.opened, false)) {}

FileHandle& FileHandle::operator=(FileHandle&& other) noexcept {
    if (this == &other)
        return *this;
    this->release();
    this->location  = std::move(other.location);
    this->file      = std::move(other.file);
    this->listing   = std::move(other.listing);
    this->directory = other.directory;
    this->opened    = std::exchange(other.opened, false);
    return *this;
}

FileHandle::~FileHandle() {
    this->release();
}

auto FileHandle::read() -> Expected<Bytes> {
    if (this->directory)
        return std::unexpected(Error{Error::Code::IsDirectory, "Is a directory: '" + this->location.string() + "'"});
    if (!this->opened)
        return std::unexpected(Error{Error::Code::IoFailure, "Handle for '" + this->location.string() + "' is closed"});

    Bytes contents;
    char  buffer[4096];
    while (this->file.read(buffer, sizeof(buffer)) || this->file.gcount() > 0) {
        auto const count = static_cast<std::size_t>(this->file.gcount());
        std::transform(buffer, buffer + count, std::back_inserter(contents), [](char c) { return static_cast<std::byte>(c); });
    }
    if (this->file.bad())
        return std::unexpected(Error{Error::Code::IoFailure, "Failed reading '" + this->location.string() + "'"});
    return contents;
}

auto FileHandle::entries() const -> Expected<std::vector<std::string>> {
    if (!this->directory)
        return std::unexpected(Error{Error::Code::NotIndexable, "Not a directory: '" + this->location.string() + "'"});
    return this->listing;
}

auto FileHandle::close() -> void {
    if (this->release())
        tp_log("Closed handle " + this->location.string(), "FilesystemAccessor");
}

auto FileHandle::release() noexcept -> bool {
    if (!this->opened)
        return false;
    if (this->file.is_open())
        this->file.close();
    this->listing.clear();
    this->opened = false;
    return true;
}

} // namespace TP
