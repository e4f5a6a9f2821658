#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace TP {

enum class ErrorKind {
    Structural,
    Semantic,
    Resource,
    Internal
};

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        // Structural: the descriptor does not have the expected shape.
        MalformedInput,
        MissingField,
        InvalidType,
        UnknownKey,
        InvalidValue,
        // Semantic: well-formed, but cannot be resolved into an image.
        ConflictingFields,
        SizeMismatch,
        OutOfBounds,
        InvalidParentReference,
        ColorOutOfRange,
        VersionTooLow,
        UnsupportedVersion,
        // Resource: files the render depends on.
        ResourceNotFound,
        ResourceUnreadable,
        ImageDecodeFailed,
        WriteFailed
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
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::MissingField:
        return "missing_field";
    case Error::Code::InvalidType:
        return "invalid_type";
    case Error::Code::UnknownKey:
        return "unknown_key";
    case Error::Code::InvalidValue:
        return "invalid_value";
    case Error::Code::ConflictingFields:
        return "conflicting_fields";
    case Error::Code::SizeMismatch:
        return "size_mismatch";
    case Error::Code::OutOfBounds:
        return "out_of_bounds";
    case Error::Code::InvalidParentReference:
        return "invalid_parent_reference";
    case Error::Code::ColorOutOfRange:
        return "color_out_of_range";
    case Error::Code::VersionTooLow:
        return "version_too_low";
    case Error::Code::UnsupportedVersion:
        return "unsupported_version";
    case Error::Code::ResourceNotFound:
        return "resource_not_found";
    case Error::Code::ResourceUnreadable:
        return "resource_unreadable";
    case Error::Code::ImageDecodeFailed:
        return "image_decode_failed";
    case Error::Code::WriteFailed:
        return "write_failed";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorKind(Error::Code code) -> ErrorKind {
    switch (code) {
    case Error::Code::MalformedInput:
    case Error::Code::MissingField:
    case Error::Code::InvalidType:
    case Error::Code::UnknownKey:
    case Error::Code::InvalidValue:
        return ErrorKind::Structural;
    case Error::Code::ConflictingFields:
    case Error::Code::SizeMismatch:
    case Error::Code::OutOfBounds:
    case Error::Code::InvalidParentReference:
    case Error::Code::ColorOutOfRange:
    case Error::Code::VersionTooLow:
    case Error::Code::UnsupportedVersion:
        return ErrorKind::Semantic;
    case Error::Code::ResourceNotFound:
    case Error::Code::ResourceUnreadable:
    case Error::Code::ImageDecodeFailed:
    case Error::Code::WriteFailed:
        return ErrorKind::Resource;
    case Error::Code::InvalidError:
    case Error::Code::UnknownError:
        break;
    }
    return ErrorKind::Internal;
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

// Builds "<field>: <detail>" messages so every report carries its document path.
[[nodiscard]] inline auto makeError(Error::Code code, std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        if (!field.empty()) {
            message.append(": ");
        }
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

} // namespace TP
