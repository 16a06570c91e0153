#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tabula {

/// Failure categories surfaced by the engine. None of them is retried internally.
enum class ErrorKind : std::uint8_t {
    EmptyInput,
    SchemaMismatch,
    TypeCoercion,
    MissingColumn,
    Io,
};

/// Stable display name, e.g. "TypeCoercionError".
[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Engine error: a kind plus a human-readable message.
struct Error {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

using Status = Result<void>;

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message)
    -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

/// Pipeline stages, in execution order.
enum class Stage : std::uint8_t {
    Load,
    Normalize,
    Aggregate,
    Persist,
};

[[nodiscard]] auto to_string(Stage stage) -> std::string_view;

/// An engine error tagged with the stage that produced it.
struct StageError {
    Stage stage = Stage::Load;
    Error error;

    /// "stage 'normalize' failed: TypeCoercionError: ..."
    [[nodiscard]] auto format() const -> std::string;
};

}  // namespace tabula
