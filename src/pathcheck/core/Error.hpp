#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace PC {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidPath,
        NoSuchPath,
        PreconditionFailed,
        SystemError,
        NotSupported, // reserved for platforms lacking an operation; nothing reports it yet
        MalformedInput
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
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::NoSuchPath:
        return "no_such_path";
    case Error::Code::PreconditionFailed:
        return "precondition_failed";
    case Error::Code::SystemError:
        return "system_error";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::MalformedInput:
        return "malformed_input";
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

// Same error, message prefixed with what the caller was doing.
[[nodiscard]] inline auto withContext(std::string const& context, Error const& error) -> Error {
    return Error{error.code, context + ": " + error.message.value_or("")};
}

// Error carrying the text of the current errno, prefixed with what was attempted.
[[nodiscard]] auto systemError(std::string_view what) -> Error;
[[nodiscard]] auto systemError(std::string_view what, int errnum) -> Error;

} // namespace PC
