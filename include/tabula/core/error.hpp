#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tabula {

/// Failure categories reported by table operations.
enum class ErrorKind : std::uint8_t {
    UnknownColumn,
    DuplicateColumn,
    LengthMismatch,
    IndexMismatch,
    OutOfBounds,
    NonContiguousInsert,
    NonExistentTarget,
    ShapeMismatch,
    EmptyResult,
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// Error value carried by Result<T>.
struct Error {
    ErrorKind kind = ErrorKind::ShapeMismatch;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

/// Result type for internal table operations.
template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error>;

/// Exception thrown by the public Table / TableView / RowView API.
class TableError : public std::runtime_error {
   public:
    explicit TableError(Error error);

    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return error_.kind; }
    [[nodiscard]] auto error() const noexcept -> const Error& { return error_; }

   private:
    Error error_;
};

/// Unwrap a Result, throwing TableError on failure.
template <typename T>
auto unwrap(Result<T> result) -> T {
    if (!result) {
        throw TableError(std::move(result).error());
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(*result);
    }
}

}  // namespace tabula
