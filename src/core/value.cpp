#include <tabula/core/value.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace tabula {

namespace {

// Seeds that keep NA and NaN away from small integer hashes.
constexpr std::size_t kNaHash = 0x6e61'6e61'6e61'6e61ULL;
constexpr std::size_t kNanHash = 0x7ff8'0000'0000'0001ULL;

// A double holding an integral value representable as int64.
auto exact_int(double value) -> std::optional<std::int64_t> {
    if (!std::isfinite(value) || std::trunc(value) != value) {
        return std::nullopt;
    }
    // 2^63 is exactly representable; anything at or above it overflows int64.
    constexpr double kLimit = 9223372036854775808.0;
    if (value >= kLimit || value < -kLimit) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

auto numeric_equal(std::int64_t lhs, double rhs) -> bool {
    auto as_int = exact_int(rhs);
    return as_int.has_value() && *as_int == lhs;
}

// Structural comparison of two non-NA values. Int and Double compare by
// numeric value; all other kinds compare only with themselves.
auto same_value(const Value& lhs, const Value& rhs, bool nan_equal) -> bool {
    return std::visit(
        [&](const auto& l) -> bool {
            using L = std::decay_t<decltype(l)>;
            return std::visit(
                [&](const auto& r) -> bool {
                    using R = std::decay_t<decltype(r)>;
                    if constexpr (std::is_same_v<L, double> && std::is_same_v<R, double>) {
                        if (nan_equal && std::isnan(l) && std::isnan(r)) {
                            return true;
                        }
                        return l == r;
                    } else if constexpr (std::is_same_v<L, std::int64_t> &&
                                         std::is_same_v<R, double>) {
                        return numeric_equal(l, r);
                    } else if constexpr (std::is_same_v<L, double> &&
                                         std::is_same_v<R, std::int64_t>) {
                        return numeric_equal(r, l);
                    } else if constexpr (std::is_same_v<L, R>) {
                        return l == r;
                    } else {
                        return false;
                    }
                },
                rhs.storage());
        },
        lhs.storage());
}

}  // namespace

auto to_string(ElementType type) noexcept -> std::string_view {
    switch (type) {
        case ElementType::Bool:
            return "Bool";
        case ElementType::Int:
            return "Int";
        case ElementType::Double:
            return "Double";
        case ElementType::String:
            return "String";
        case ElementType::Dynamic:
            return "Dynamic";
    }
    return "Dynamic";
}

auto Value::type() const noexcept -> std::optional<ElementType> {
    return std::visit(
        [](const auto& v) -> std::optional<ElementType> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NAType>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<T, bool>) {
                return ElementType::Bool;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return ElementType::Int;
            } else if constexpr (std::is_same_v<T, double>) {
                return ElementType::Double;
            } else {
                return ElementType::String;
            }
        },
        data_);
}

auto promote(ElementType lhs, ElementType rhs) noexcept -> ElementType {
    if (lhs == rhs) {
        return lhs;
    }
    auto numeric_rank = [](ElementType t) -> int {
        switch (t) {
            case ElementType::Bool:
                return 0;
            case ElementType::Int:
                return 1;
            case ElementType::Double:
                return 2;
            default:
                return -1;
        }
    };
    int l = numeric_rank(lhs);
    int r = numeric_rank(rhs);
    if (l < 0 || r < 0) {
        return ElementType::Dynamic;
    }
    return l > r ? lhs : rhs;
}

auto promote(std::optional<ElementType> lhs, ElementType rhs) noexcept -> ElementType {
    if (!lhs.has_value()) {
        return rhs;
    }
    return promote(*lhs, rhs);
}

auto equals(const Value& lhs, const Value& rhs) -> Truth {
    if (lhs.is_na() || rhs.is_na()) {
        return Truth::Unknown;
    }
    return same_value(lhs, rhs, false) ? Truth::True : Truth::False;
}

auto equivalent(const Value& lhs, const Value& rhs) -> bool {
    if (lhs.is_na() || rhs.is_na()) {
        return lhs.is_na() && rhs.is_na();
    }
    return same_value(lhs, rhs, true);
}

auto hash_value(const Value& value) -> std::size_t {
    return std::visit(
        [](const auto& v) -> std::size_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, NAType>) {
                return kNaHash;
            } else if constexpr (std::is_same_v<T, bool>) {
                // Bools never compare equal to numbers; keep them in their own space.
                return hash_combine(std::hash<bool>{}(v), 0xb001ULL);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return kNanHash;
                }
                if (auto as_int = exact_int(v)) {
                    return std::hash<std::int64_t>{}(*as_int);
                }
                return std::hash<double>{}(v);
            } else {
                return std::hash<T>{}(v);
            }
        },
        value.storage());
}

auto convert(const Value& value, ElementType type) -> std::optional<Value> {
    if (value.is_na() || type == ElementType::Dynamic) {
        return value;
    }
    switch (type) {
        case ElementType::Bool:
            if (value.holds<bool>()) {
                return value;
            }
            if (const auto* i = value.get_if<std::int64_t>(); i != nullptr && (*i == 0 || *i == 1)) {
                return Value{*i == 1};
            }
            if (const auto* d = value.get_if<double>(); d != nullptr && (*d == 0.0 || *d == 1.0)) {
                return Value{*d == 1.0};
            }
            return std::nullopt;
        case ElementType::Int:
            if (value.holds<std::int64_t>()) {
                return value;
            }
            if (const auto* b = value.get_if<bool>()) {
                return Value{static_cast<std::int64_t>(*b ? 1 : 0)};
            }
            if (const auto* d = value.get_if<double>()) {
                if (auto as_int = exact_int(*d)) {
                    return Value{*as_int};
                }
            }
            return std::nullopt;
        case ElementType::Double:
            if (value.holds<double>()) {
                return value;
            }
            if (const auto* i = value.get_if<std::int64_t>()) {
                return Value{static_cast<double>(*i)};
            }
            if (const auto* b = value.get_if<bool>()) {
                return Value{*b ? 1.0 : 0.0};
            }
            return std::nullopt;
        case ElementType::String:
            if (value.holds<std::string>()) {
                return value;
            }
            return std::nullopt;
        case ElementType::Dynamic:
            return value;
    }
    return std::nullopt;
}

}  // namespace tabula
