#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace TP {

struct Error {
    enum class Code {
        UnknownError = 0,
        KeyMissing,
        IndexOutOfRange,
        NotIndexable,
        EmptyPath,
        PathMismatch,
        InvalidCacheSize,
        IsDirectory,
        InvalidName,
        IoFailure
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::KeyMissing:
        return "key_missing";
    case Error::Code::IndexOutOfRange:
        return "index_out_of_range";
    case Error::Code::NotIndexable:
        return "not_indexable";
    case Error::Code::EmptyPath:
        return "empty_path";
    case Error::Code::PathMismatch:
        return "path_mismatch";
    case Error::Code::InvalidCacheSize:
        return "invalid_cache_size";
    case Error::Code::IsDirectory:
        return "is_directory";
    case Error::Code::InvalidName:
        return "invalid_name";
    case Error::Code::IoFailure:
        return "io_failure";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace TP
