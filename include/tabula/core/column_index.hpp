#pragma once

#include <tabula/core/error.hpp>

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tabula {

/// Throws TableError(kind) reporting a negative position.
[[noreturn]] void throw_negative_position(ErrorKind kind, long long position);

/// `position` as an unsigned index; negative values throw TableError(kind).
template <std::integral I>
auto checked_position(I position, ErrorKind kind) -> std::size_t {
    if constexpr (std::is_signed_v<I>) {
        if (position < 0) {
            throw_negative_position(kind, static_cast<long long>(position));
        }
    }
    return static_cast<std::size_t>(position);
}

/// A column address: a name or a zero-based position.
class ColumnKey {
   public:
    ColumnKey(std::string name) : key_(std::move(name)) {}
    ColumnKey(std::string_view name) : key_(std::string(name)) {}
    ColumnKey(const char* name) : key_(std::string(name)) {}

    template <std::integral I>
        requires(!std::same_as<I, bool>)
    ColumnKey(I position) : key_(checked_position(position, ErrorKind::UnknownColumn)) {}

    [[nodiscard]] auto is_name() const noexcept -> bool {
        return std::holds_alternative<std::string>(key_);
    }
    [[nodiscard]] auto is_position() const noexcept -> bool { return !is_name(); }

    [[nodiscard]] auto name() const -> const std::string& { return std::get<std::string>(key_); }
    [[nodiscard]] auto position() const -> std::size_t { return std::get<std::size_t>(key_); }

    /// Name, or "#<position>" for positional keys; used in error messages.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const ColumnKey&) const -> bool = default;

   private:
    std::variant<std::string, std::size_t> key_;
};

/// Bidirectional name <-> position map for the columns of a table.
///
/// Names are unique. Every position in [0, size()) has exactly one name and
/// the name -> position lookup is rebuilt whenever positions shift.
class ColumnIndex {
   public:
    ColumnIndex() = default;

    /// Throws TableError(DuplicateColumn) if `names` repeats a name.
    explicit ColumnIndex(std::vector<std::string> names);

    [[nodiscard]] static auto make(std::vector<std::string> names) -> Result<ColumnIndex>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return names_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return names_.empty(); }
    [[nodiscard]] auto names() const noexcept -> const std::vector<std::string>& { return names_; }
    [[nodiscard]] auto name(std::size_t position) const -> const std::string& {
        return names_.at(position);
    }

    [[nodiscard]] auto contains(const ColumnKey& key) const -> bool;
    [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;

    /// Resolve a key to a position. Unknown names and out-of-range positions
    /// fail with UnknownColumn.
    [[nodiscard]] auto position(const ColumnKey& key) const -> Result<std::size_t>;

    [[nodiscard]] auto resolve(const std::vector<ColumnKey>& keys) const
        -> Result<std::vector<std::size_t>>;

    /// Positions of the true entries of a mask; the mask must cover every column.
    [[nodiscard]] auto resolve(const std::vector<bool>& mask) const
        -> Result<std::vector<std::size_t>>;

    /// Append a name; returns its position.
    [[nodiscard]] auto insert(std::string name) -> Result<std::size_t>;

    /// Insert a name at `position`, shifting later names right.
    [[nodiscard]] auto insert_at(std::size_t position, std::string name) -> Result<void>;

    [[nodiscard]] auto rename(const ColumnKey& key, std::string new_name) -> Result<void>;
    [[nodiscard]] auto set_names(std::vector<std::string> names) -> Result<void>;
    [[nodiscard]] auto remove(std::size_t position) -> Result<void>;

    /// First free name of the form prefix + k, starting at k = size() + 1.
    [[nodiscard]] auto next_name(std::string_view prefix) const -> std::string;

    auto operator==(const ColumnIndex& other) const -> bool { return names_ == other.names_; }

   private:
    void rebuild();

    std::vector<std::string> names_;
    std::unordered_map<std::string, std::size_t> lookup_;
};

/// prefix1 .. prefixN
[[nodiscard]] auto generate_names(std::size_t count, std::string_view prefix = "x")
    -> std::vector<std::string>;

/// Ascending positions of the true entries of a mask.
[[nodiscard]] auto mask_positions(const std::vector<bool>& mask) -> std::vector<std::size_t>;

}  // namespace tabula
