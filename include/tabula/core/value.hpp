#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tabula {

/// Missing-value marker.
struct NAType {
    auto operator<=>(const NAType&) const = default;
};

inline constexpr NAType NA{};

/// Closed set of column element kinds. Dynamic columns hold arbitrary Values.
enum class ElementType : std::uint8_t {
    Bool,
    Int,
    Double,
    String,
    Dynamic,
};

/// Three-valued comparison outcome. Any comparison involving NA is Unknown.
enum class Truth : std::uint8_t {
    False,
    True,
    Unknown,
};

[[nodiscard]] auto to_string(ElementType type) noexcept -> std::string_view;

/// Kleene conjunction: False dominates, then Unknown.
[[nodiscard]] constexpr auto truth_and(Truth lhs, Truth rhs) noexcept -> Truth {
    if (lhs == Truth::False || rhs == Truth::False) {
        return Truth::False;
    }
    if (lhs == Truth::Unknown || rhs == Truth::Unknown) {
        return Truth::Unknown;
    }
    return Truth::True;
}

/// A single NA-capable cell value.
///
/// Integral arguments are stored as int64, floating-point arguments as
/// double. Default construction yields NA. operator== and operator<=> compare
/// storage structurally (NA == NA); use equals() / equivalent() for
/// NA-aware semantics.
class Value {
   public:
    using storage_type = std::variant<NAType, bool, std::int64_t, double, std::string>;

    Value() = default;
    Value(NAType /*na*/) {}
    Value(bool value) : data_(value) {}

    template <std::integral I>
        requires(!std::same_as<I, bool>)
    Value(I value) : data_(static_cast<std::int64_t>(value)) {}

    template <std::floating_point F>
    Value(F value) : data_(static_cast<double>(value)) {}

    Value(std::string value) : data_(std::move(value)) {}
    Value(std::string_view value) : data_(std::string(value)) {}
    Value(const char* value) : data_(std::string(value)) {}

    [[nodiscard]] auto is_na() const noexcept -> bool {
        return std::holds_alternative<NAType>(data_);
    }

    /// Element type of the held value; nullopt for NA.
    [[nodiscard]] auto type() const noexcept -> std::optional<ElementType>;

    template <typename T>
    [[nodiscard]] auto holds() const noexcept -> bool {
        return std::holds_alternative<T>(data_);
    }

    /// Typed access; throws std::bad_variant_access on kind mismatch.
    template <typename T>
    [[nodiscard]] auto get() const -> const T& {
        return std::get<T>(data_);
    }

    template <typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&data_);
    }

    [[nodiscard]] auto storage() const noexcept -> const storage_type& { return data_; }

    auto operator==(const Value&) const -> bool = default;
    auto operator<=>(const Value&) const = default;

   private:
    storage_type data_;
};

/// Least upper bound of two element types.
[[nodiscard]] auto promote(ElementType lhs, ElementType rhs) noexcept -> ElementType;

/// Promotion starting from "no type yet".
[[nodiscard]] auto promote(std::optional<ElementType> lhs, ElementType rhs) noexcept
    -> ElementType;

/// NA-propagating equality: Unknown if either side is NA.
[[nodiscard]] auto equals(const Value& lhs, const Value& rhs) -> Truth;

/// Identity-style equality: NA equals NA, NA never equals a value, NaN equals NaN.
[[nodiscard]] auto equivalent(const Value& lhs, const Value& rhs) -> bool;

/// Hash consistent with equivalent().
[[nodiscard]] auto hash_value(const Value& value) -> std::size_t;

/// Convert a value to a column element type. NA converts to NA for every type;
/// nullopt means the value cannot be represented.
[[nodiscard]] auto convert(const Value& value, ElementType type) -> std::optional<Value>;

/// Order-sensitive bit mix used for row, column and table hashes.
[[nodiscard]] constexpr auto hash_combine(std::size_t seed, std::size_t value) noexcept
    -> std::size_t {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

}  // namespace tabula

namespace std {

template <>
struct hash<tabula::Value> {
    auto operator()(const tabula::Value& value) const -> std::size_t {
        return tabula::hash_value(value);
    }
};

}  // namespace std
