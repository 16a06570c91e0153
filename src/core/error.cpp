#include <tabula/core/error.hpp>

#include <fmt/format.h>

namespace tabula {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::EmptyInput:
            return "EmptyInputError";
        case ErrorKind::SchemaMismatch:
            return "SchemaMismatchError";
        case ErrorKind::TypeCoercion:
            return "TypeCoercionError";
        case ErrorKind::MissingColumn:
            return "MissingColumnError";
        case ErrorKind::Io:
            return "IOError";
    }
    return "UnknownError";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

auto to_string(Stage stage) -> std::string_view {
    switch (stage) {
        case Stage::Load:
            return "load";
        case Stage::Normalize:
            return "normalize";
        case Stage::Aggregate:
            return "aggregate";
        case Stage::Persist:
            return "persist";
    }
    return "unknown";
}

auto StageError::format() const -> std::string {
    return fmt::format("stage '{}' failed: {}", to_string(stage), error.format());
}

}  // namespace tabula
