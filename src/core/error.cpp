#include <tabula/core/error.hpp>

#include <fmt/format.h>

namespace tabula {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::UnknownColumn:
            return "UnknownColumn";
        case ErrorKind::DuplicateColumn:
            return "DuplicateColumn";
        case ErrorKind::LengthMismatch:
            return "LengthMismatch";
        case ErrorKind::IndexMismatch:
            return "IndexMismatch";
        case ErrorKind::OutOfBounds:
            return "OutOfBounds";
        case ErrorKind::NonContiguousInsert:
            return "NonContiguousInsert";
        case ErrorKind::NonExistentTarget:
            return "NonExistentTarget";
        case ErrorKind::ShapeMismatch:
            return "ShapeMismatch";
        case ErrorKind::EmptyResult:
            return "EmptyResult";
    }
    return "Unknown";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

TableError::TableError(Error error) : std::runtime_error(error.format()), error_(std::move(error)) {}

}  // namespace tabula
