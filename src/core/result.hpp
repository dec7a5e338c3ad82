#pragma once

#include <optional>
#include <string>
#include <variant>

namespace ij {

enum class ErrorKind {
    Io,        // file could not be opened or read
    Script,    // Lua failed to load or run a chunk
    Config,    // script ran but produced an unusable world description
    Placement, // structure footprint rejected by the world
};

struct Error {
    ErrorKind kind = ErrorKind::Config;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

/// Holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Io: return "io";
    case ErrorKind::Script: return "script";
    case ErrorKind::Config: return "config";
    case ErrorKind::Placement: return "placement";
    }
    return "unknown";
}

} // namespace ij
