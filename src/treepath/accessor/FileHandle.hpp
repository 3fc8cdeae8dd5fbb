#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace TP {

using Bytes = std::vector<std::byte>;

// Scoped access to a file (binary input stream) or a directory (entry listing
// captured at open time). The resource is released by close() or on destruction.
class FileHandle {
public:
    static auto open(std::filesystem::path const& path) -> Expected<FileHandle>;

    FileHandle(FileHandle&& other) noexcept;
    FileHandle& operator=(FileHandle&& other) noexcept;
    FileHandle(FileHandle const&)            = delete;
    FileHandle& operator=(FileHandle const&) = delete;
    ~FileHandle();

    [[nodiscard]] auto path() const -> std::filesystem::path const& { return this->location; }
    [[nodiscard]] auto isDirectory() const -> bool { return this->directory; }
    [[nodiscard]] auto isOpen() const -> bool { return this->opened; }

    // Remaining bytes of a file; IsDirectory for directory handles.
    auto read() -> Expected<Bytes>;
    // Sorted entry names of a directory; NotIndexable for file handles.
    [[nodiscard]] auto entries() const -> Expected<std::vector<std::string>>;
    auto stream() -> std::istream& { return this->file; }

    // Releases the resource and logs the close. Destruction releases silently.
    auto close() -> void;

private:
    FileHandle(std::filesystem::path path, std::ifstream stream);
    FileHandle(std::filesystem::path path, std::vector<std::string> listing);

    // Releases the resource without logging; safe from noexcept members.
    auto release() noexcept -> bool;

    std::filesystem::path    location;
    std::ifstream            file;
    std::vector<std::string> listing;
    bool                     directory = false;
    bool                     opened    = false;
};

} // namespace TP
